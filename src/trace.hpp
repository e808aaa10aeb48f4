#ifndef TRACE_HPP
#define TRACE_HPP

namespace reprint {
    // Master flag - set to true to enable debug tracing at compile time.
    inline constexpr bool ENABLE_TRACING = false;

    // Renderer dispatch and line-wrap decisions.
    inline constexpr bool TRACE_RENDER = ENABLE_TRACING && true;
    inline constexpr bool TRACE_WRAP = ENABLE_TRACING && false;

    // Type table registration.
    inline constexpr bool TRACE_REGISTRY = ENABLE_TRACING && false;

    // Loading of bundles and value descriptions.
    inline constexpr bool TRACE_BUNDLE_READER = ENABLE_TRACING && false;
    inline constexpr bool TRACE_PARSE_VALUE = ENABLE_TRACING && false;

    // Main program tracing.
    inline constexpr bool TRACE_MAIN = ENABLE_TRACING && false;
}

#endif // TRACE_HPP
