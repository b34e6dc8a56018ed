#ifndef GEM_CORE_CONFIG_H
#define GEM_CORE_CONFIG_H

#include <cstddef>

namespace gem::core::config {

inline constexpr int kDefaultWindowX = 45;
inline constexpr int kDefaultWindowY = 35;
inline constexpr int kDefaultWindowWidth = 30;
inline constexpr int kDefaultWindowHeight = 20;
inline constexpr const char kDefaultWindowTitle[] = "Title";

inline constexpr int kDefaultRectWidth = 10;
inline constexpr int kDefaultRectHeight = 6;
inline constexpr int kRectCenterOffsetX = 5;
inline constexpr int kRectCenterOffsetY = 3;
inline constexpr int kDefaultCircleRadius = 4;

inline constexpr std::size_t kMaxShorthandMarkers = 3;
inline constexpr const char kShorthandFileName[] = "<md-content>";

inline constexpr const char kStylesheetExtension[] = ".gms";
inline constexpr const char kMarkdownExtension[] = ".md";

}  // namespace gem::core::config

#endif  // GEM_CORE_CONFIG_H
