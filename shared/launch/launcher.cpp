#include "launcher.hpp"

#include <algorithm>
#include <cctype>

namespace sfxpack::launch {

std::optional<WindowState> parse_window_state(std::string_view text) {
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (s == "normal") return WindowState::Normal;
    if (s == "maximized") return WindowState::Maximized;
    if (s == "minimized") return WindowState::Minimized;
    if (s == "hidden" || s == "no-window") return WindowState::Hidden;
    return std::nullopt;
}

const char* window_state_name(WindowState state) {
    switch (state) {
    case WindowState::Normal: return "normal";
    case WindowState::Maximized: return "maximized";
    case WindowState::Minimized: return "minimized";
    case WindowState::Hidden: return "hidden";
    }
    return "unknown";
}

} // namespace sfxpack::launch
