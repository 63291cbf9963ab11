#pragma once

#include <stdexcept>
#include <string>

namespace flatring {

    /**
     * @brief Thrown when a coordinate layout cannot be resolved or does not match the data
     */
    class InvalidLayout : public std::invalid_argument {
      public:
        explicit InvalidLayout(const std::string &what) : std::invalid_argument(what) {}
    };

    /**
     * @brief Thrown when a vertex tuple does not have as many components as the buffer stride
     */
    class InvalidCoordinate : public std::invalid_argument {
      public:
        explicit InvalidCoordinate(const std::string &what) : std::invalid_argument(what) {}
    };

} // namespace flatring
