#pragma once

#include <string>
#include <vector>

namespace ui_fonts {

enum class Weight { Regular, Bold };

// First existing file among the candidates, or the first candidate when none
// exists (TTF_OpenFont then reports the failure).
std::string first_existing(const std::vector<std::string>& candidates);

// CHARKIT_FONT / CHARKIT_FONT_BOLD override the system search.
std::string system_sans(Weight weight);

inline std::string sans_regular() { return system_sans(Weight::Regular); }
inline std::string sans_bold() { return system_sans(Weight::Bold); }

}
