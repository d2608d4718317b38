#include <vitrine/dynamic/param.hpp>

#include <cmath>

namespace vitrine::dynamic {

TextParam::TextParam(std::string name, std::string value)
    : m_name(std::move(name))
    , m_value(std::move(value)) {}

Param TextParam::ToParam() const {
    return Param{m_name, Value::Text(m_value)};
}

void TextParam::Apply(const Value &value) {
    if (const auto *text = value.Get<std::string>()) {
        m_value = *text;
    }
}

// -----------------------------------------------------------------------------

NumberParam::NumberParam(std::string name, sint32 value)
    : m_name(std::move(name))
    , m_value(value) {}

Param NumberParam::ToParam() const {
    return Param{m_name, Value::Int32(m_value)};
}

void NumberParam::Apply(const Value &value) {
    if (const auto *number = value.Get<sint32>()) {
        m_value = *number;
    }
}

// -----------------------------------------------------------------------------

BoolParam::BoolParam(std::string name, bool value)
    : m_name(std::move(name))
    , m_value(value) {}

Param BoolParam::ToParam() const {
    return Param{m_name, Value::Bool(m_value)};
}

void BoolParam::Apply(const Value &value) {
    if (const auto *flag = value.Get<bool>()) {
        m_value = *flag;
    }
}

// -----------------------------------------------------------------------------

SliderParam::SliderParam(std::string name, float32 min, float32 max, float32 value)
    : m_name(std::move(name))
    , m_min(min)
    , m_max(max) {
    if (!(min <= max)) {
        throw std::invalid_argument(fmt::format("slider parameter \"{}\": invalid range [{}, {}]", m_name, min, max));
    }
    // A NaN default has no position in the range
    m_value = std::isnan(value) ? m_min : std::clamp(value, m_min, m_max);
}

Param SliderParam::ToParam() const {
    return Param{m_name, Value::Slider(m_value, m_min, m_max)};
}

void SliderParam::Apply(const Value &value) {
    if (const auto *slider = value.Get<SliderValue>(); slider != nullptr && !std::isnan(slider->current)) {
        m_value = std::clamp(slider->current, m_min, m_max);
    }
}

// -----------------------------------------------------------------------------

namespace {

    float32 ClampComponent(float32 component) {
        return std::isnan(component) ? 0.0f : std::clamp(component, 0.0f, 1.0f);
    }

    bool HasNaN(const Rgba &color) {
        return std::isnan(color.r) || std::isnan(color.g) || std::isnan(color.b) || std::isnan(color.a);
    }

} // namespace

Rgba ClampColor(Rgba color) {
    return Rgba{
        .r = ClampComponent(color.r),
        .g = ClampComponent(color.g),
        .b = ClampComponent(color.b),
        .a = ClampComponent(color.a),
    };
}

ColorParam::ColorParam(std::string name, Rgba value)
    : m_name(std::move(name))
    , m_value(ClampColor(value)) {}

Param ColorParam::ToParam() const {
    return Param{m_name, Value::Color(m_value)};
}

void ColorParam::Apply(const Value &value) {
    if (const auto *color = value.Get<Rgba>(); color != nullptr && !HasNaN(*color)) {
        m_value = ClampColor(*color);
    }
}

// -----------------------------------------------------------------------------

TextParam MakeText(std::string name, std::string value) {
    return TextParam{std::move(name), std::move(value)};
}

NumberParam MakeNumber(std::string name, sint32 value) {
    return NumberParam{std::move(name), value};
}

BoolParam MakeBoolean(std::string name, bool value) {
    return BoolParam{std::move(name), value};
}

SliderParam MakeSlider(std::string name, float32 min, float32 max, float32 value) {
    return SliderParam{std::move(name), min, max, value};
}

ColorParam MakeColor(std::string name, Rgba value) {
    return ColorParam{std::move(name), value};
}

SelectParam<std::string> MakeSelect(std::string name, std::vector<std::string> options, std::string value) {
    return SelectParam<std::string>{std::move(name), std::move(options), value};
}

} // namespace vitrine::dynamic
