#ifndef VPCCTL_VERSION_HPP
#define VPCCTL_VERSION_HPP

#pragma once

namespace vpcctl {

    /// Name printed by the CLI and used as the logger name.
    inline constexpr const char* program_name = "vpcctl";

    /// Combined version string, printed by `vpcctl --version`.
    inline constexpr const char* version_string = "0.1.0";

} // namespace vpcctl

#endif // VPCCTL_VERSION_HPP
