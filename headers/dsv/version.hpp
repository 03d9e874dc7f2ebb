//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_VERSION_HPP
#define DEPSIEVE_VERSION_HPP

/**
 * @file version.hpp
 * @brief depsieve version information.
 */

namespace dsv {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 4;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "0.4.0";

    constexpr auto PROJECT_NAME = "depsieve";

    /**
     * Executable name used in usage text.
     */
    constexpr auto PROJECT_SHORT_NAME = "depsieve";

}  // namespace dsv

#endif //DEPSIEVE_VERSION_HPP
