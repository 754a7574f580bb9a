#pragma once
#include <stdexcept>
#include <string>

namespace Reader {
namespace Core {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing or unparseable target URL.
class InvalidUrlError : public Error {
public:
    using Error::Error;
};

// Neither the PDF probe nor the browser render produced content.
class FetchError : public Error {
public:
    using Error::Error;
};

// Content was fetched but the PDF document could not be opened.
class PdfParseError : public Error {
public:
    using Error::Error;
};

}  // namespace Core
}  // namespace Reader
