#ifndef RKG_VERSION_HPP
#define RKG_VERSION_HPP

/**
 * @file version.hpp
 * @brief Version constants.
 *
 * VERSION_STRING is also the format version written into the graph and
 * index artifacts.
 */

namespace rkg {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Repository Knowledge Graph";
    constexpr auto PROJECT_SHORT_NAME = "rkg";

}  // namespace rkg

#endif  // RKG_VERSION_HPP
