//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef GCS_VERSION_HPP
#define GCS_VERSION_HPP

/**
 * @file version.hpp
 * @brief Version information.
 */

namespace gcs {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 3;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.3.0";

    constexpr auto PROJECT_NAME = "Git Contribution Statistics";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "gcs";

}  // namespace gcs

#endif //GCS_VERSION_HPP
