#include <vitrine/dynamic/value.hpp>

namespace vitrine::dynamic {

const char *ValueKindName(ValueKind kind) {
    switch (kind) {
    case ValueKind::Bool: return "Bool";
    case ValueKind::Text: return "Text";
    case ValueKind::Int32: return "Int32";
    case ValueKind::Select: return "Select";
    case ValueKind::Slider: return "Slider";
    case ValueKind::Color: return "Color";
    }
    return "Unknown";
}

Value Value::Bool(bool value) {
    return Value{Storage{std::in_place_type<bool>, value}};
}

Value Value::Text(std::string value) {
    return Value{Storage{std::in_place_type<std::string>, std::move(value)}};
}

Value Value::Int32(sint32 value) {
    return Value{Storage{std::in_place_type<sint32>, value}};
}

Value Value::Select(usize selected, std::vector<std::string> options) {
    return Value{Storage{std::in_place_type<SelectValue>, SelectValue{selected, std::move(options)}}};
}

Value Value::Slider(float32 current, float32 min, float32 max) {
    return Value{Storage{std::in_place_type<SliderValue>, SliderValue{current, min, max}}};
}

Value Value::Color(Rgba color) {
    return Value{Storage{std::in_place_type<Rgba>, color}};
}

} // namespace vitrine::dynamic

std::string fmt::formatter<vitrine::dynamic::Value>::Describe(const vitrine::dynamic::Value &value) {
    using namespace vitrine::dynamic;

    switch (value.Kind()) {
    case ValueKind::Bool: return fmt::format("Bool({})", *value.Get<bool>());
    case ValueKind::Text: return fmt::format("Text(\"{}\")", *value.Get<std::string>());
    case ValueKind::Int32: return fmt::format("Int32({})", *value.Get<sint32>());
    case ValueKind::Select: {
        const auto &select = *value.Get<SelectValue>();
        if (select.selected < select.options.size()) {
            return fmt::format("Select({}: \"{}\")", select.selected, select.options[select.selected]);
        }
        return fmt::format("Select({})", select.selected);
    }
    case ValueKind::Slider: {
        const auto &slider = *value.Get<SliderValue>();
        return fmt::format("Slider({} in [{}, {}])", slider.current, slider.min, slider.max);
    }
    case ValueKind::Color: {
        const auto &color = *value.Get<Rgba>();
        return fmt::format("Color({}, {}, {}, {})", color.r, color.g, color.b, color.a);
    }
    }
    return "Unknown";
}
