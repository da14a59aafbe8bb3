//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef DUA_VERSION_HPP
#define DUA_VERSION_HPP

/**
 * @file version.hpp
 * @brief Declaration Usage Analyzer version information.
 */

namespace dua {

    /**
     * Major version number.
     * Incremented for breaking API changes.
     */
    constexpr int VERSION_MAJOR = 1;

    /**
     * Minor version number.
     * Incremented for new features with backward compatibility.
     */
    constexpr int VERSION_MINOR = 0;

    /**
     * Patch version number.
     * Incremented for bug fixes.
     */
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Declaration Usage Analyzer";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "dua";

}  // namespace dua

#endif //DUA_VERSION_HPP
