#ifndef DOCKYARD_VERSION_HPP
#define DOCKYARD_VERSION_HPP

#pragma once

namespace dockyard {

    /// Project semantic version components
    inline constexpr int version_major = 1;
    inline constexpr int version_minor = 0;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "1.0.0")
    inline constexpr const char* version_string = "1.0.0";

} // namespace dockyard

#endif // DOCKYARD_VERSION_HPP
