#include "app/app.hpp"

#include <vitrine/util/dev_log.hpp>

#include <exception>
#include <filesystem>
#include <string_view>

namespace grp {

struct base {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::error;
    static constexpr std::string_view name = "Main";
};

} // namespace grp

int main(int argc, char **argv) {
    const std::filesystem::path settingsPath = argc > 1 ? std::filesystem::path{argv[1]} : app::kSettingsFile;

    try {
        app::App app{};
        return app.Run(settingsPath);
    } catch (const std::exception &e) {
        devlog::error<grp::base>("Unhandled exception: {}", e.what());
        return 1;
    }
}
