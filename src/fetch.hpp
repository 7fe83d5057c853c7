#pragma once

#include <string>

namespace ptndle::fetch {

// Downloads url into memory, following redirects. Any failed transfer throws guard::FetchError.
std::string fetchUrl(const std::string& url);

}  // namespace ptndle::fetch
