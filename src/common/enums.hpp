#pragma once

namespace zverify {

enum class PoolHealth {
    Online,
    Degraded,
    Faulted,
    Unavail,
    Unknown
};

enum class BootMethod {
    Traditional,
    BootMenu
};

enum class UpdateCategory {
    Storage,
    BootMenu,
    InitramfsBuilder,
    Kernel,
    Other
};

enum class Severity {
    Pass,
    Warn,
    Fail
};

enum class Phase {
    Pre,
    Post
};

enum class PostStatus {
    Ready,
    RebootRequired,
    Broken
};

} // namespace zverify
