#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <string>
#include "../acquirer/content_acquirer.hpp"

namespace Reader {
namespace Engine {

// URL in, Markdown out. Errors from resolution, acquisition and PDF parsing
// propagate unchanged (Core::InvalidUrlError, Core::FetchError,
// Core::PdfParseError).
class Pipeline {
public:
    explicit Pipeline(ContentAcquirer& acquirer);

    boost::asio::awaitable<std::string> run(const std::string& raw_url);

    static std::string transform(const AcquiredContent& content);

private:
    ContentAcquirer& acquirer_;
};

}  // namespace Engine
}  // namespace Reader
