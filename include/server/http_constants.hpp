#pragma once

namespace urlscope::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kScreenshotRoute = "/screenshot";
inline constexpr const char* kHealthRoute = "/health";

} // namespace urlscope::http
