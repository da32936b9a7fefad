#ifndef SDS_ERRORS_HPP
#define SDS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sds {

/// \brief Base class of all errors thrown by this library.
class Error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// \brief An index or bit position outside of the valid range.
class IndexError : public Error {
public:
    using Error::Error;
};

/// \brief A value that doesn't fit into the declared bit width or universe.
class RangeError : public Error {
public:
    using Error::Error;
};

/// \brief A value appended during construction is smaller than its predecessor.
class MonotonicityError : public Error {
public:
    using Error::Error;
};

/// \brief Raw or serialized data is internally inconsistent.
class FormatError : public Error {
public:
    using Error::Error;
};

/// \brief A successor or predecessor query without a qualifying element.
class NotFoundError : public Error {
public:
    using Error::Error;
};

namespace detail {

[[noreturn]] inline void throwIndexError(const char* what, long long index, long long size) {
    throw IndexError(std::string(what) + ": index " + std::to_string(index) + " is out of range for size "
                     + std::to_string(size));
}

} // namespace detail

} // namespace sds

#endif // SDS_ERRORS_HPP
