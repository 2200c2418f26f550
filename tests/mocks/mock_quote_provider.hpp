#pragma once

#include <gmock/gmock.h>
#include "quote_ngin/data/quote_provider.hpp"

namespace quote_ngin {
namespace testing {

class MockQuoteProvider : public QuoteProvider {
public:
    MOCK_METHOD(Result<std::vector<QuotePoint>>, fetch,
                (const std::string& symbol, const Timestamp& from, const Timestamp& to,
                 std::chrono::milliseconds timeout),
                (override));
};

}  // namespace testing
}  // namespace quote_ngin
