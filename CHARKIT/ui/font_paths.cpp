#include "font_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace ui_fonts {
namespace {

const std::vector<std::string>& candidates_for(Weight weight) {
#ifdef _WIN32
    static const std::vector<std::string> regular{
        "C:/Windows/Fonts/segoeui.ttf", "C:/Windows/Fonts/arial.ttf"};
    static const std::vector<std::string> bold{
        "C:/Windows/Fonts/segoeuib.ttf", "C:/Windows/Fonts/arialbd.ttf"};
#elif defined(__APPLE__)
    static const std::vector<std::string> regular{
        "/System/Library/Fonts/Supplemental/Arial.ttf", "/Library/Fonts/Arial.ttf"};
    static const std::vector<std::string> bold{
        "/System/Library/Fonts/Supplemental/Arial Bold.ttf", "/Library/Fonts/Arial Bold.ttf"};
#else
    static const std::vector<std::string> regular{
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf"};
    static const std::vector<std::string> bold{
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf"};
#endif
    return weight == Weight::Bold ? bold : regular;
}

}

std::string first_existing(const std::vector<std::string>& candidates) {
    for (const std::string& path : candidates) {
        std::error_code ec;
        if (!path.empty() && std::filesystem::is_regular_file(path, ec)) {
            return path;
        }
    }
    return candidates.empty() ? std::string{} : candidates.front();
}

std::string system_sans(Weight weight) {
    const char* override_path = std::getenv(weight == Weight::Bold ? "CHARKIT_FONT_BOLD" : "CHARKIT_FONT");
    if (override_path && *override_path) {
        return override_path;
    }
    return first_existing(candidates_for(weight));
}

}
