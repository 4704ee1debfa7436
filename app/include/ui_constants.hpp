#ifndef UI_CONSTANTS_HPP
#define UI_CONSTANTS_HPP

#include <QApplication>
#include <QScreen>

namespace ui::scaling {
    // Scale factor relative to a 96 DPI baseline, cached after the first call.
    inline double factor() {
        static double cached = -1.0;
        if (cached < 0.0) {
            if (auto* screen = QApplication::primaryScreen()) {
                cached = screen->logicalDotsPerInch() / 96.0;
            } else {
                cached = 1.0;
            }
        }
        return cached;
    }

    inline int scaled(int base_value) {
        return static_cast<int>(base_value * factor());
    }
}

namespace ui::dimensions {
    // Base values at 96 DPI
    constexpr int kRelocatorMinWidth = 1040;
    constexpr int kRelocatorMinHeight = 760;
    constexpr int kSourceListHeight = 110;
    constexpr int kActionButtonWidth = 170;
    constexpr int kActionButtonHeight = 36;
    constexpr int kProgressBarHeight = 22;
}

namespace ui::colors {
    constexpr const char* kAccent = "#0078d4";
    constexpr const char* kAccentHover = "#106ebe";
    constexpr const char* kMoveColor = "#2ecc71";
    constexpr const char* kMoveHover = "#27ae60";
    constexpr const char* kWarningBg = "#4a3b1a";
    constexpr const char* kWarningBorder = "#7a6224";
    constexpr const char* kWarningText = "#ffd88a";
    constexpr const char* kOkBg = "#1a3a1a";
    constexpr const char* kOkBorder = "#2a5a2a";
    constexpr const char* kOkText = "#88cc88";
    constexpr const char* kMutedText = "#888888";
}

#endif // UI_CONSTANTS_HPP
