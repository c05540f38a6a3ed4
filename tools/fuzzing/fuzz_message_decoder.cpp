// Message decoder fuzzer - every strategy must return a value or an error, never throw,
// and all strategies must agree on success

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

#include <editrpc/protocol/message_decoder.h>

using namespace editrpc::protocol;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0)
        return 0;

    std::string_view line(reinterpret_cast<const char*>(data), size);

    auto borrowed = decodeMessage(line, DecodeStrategy::Borrowed);
    auto owned = decodeMessage(line, DecodeStrategy::Owned);
    auto tagged = decodeMessage(line, DecodeStrategy::Tagged);

    if (borrowed.has_value() != owned.has_value() || borrowed.has_value() != tagged.has_value()) {
        std::abort();
    }

    // Re-encoding a decoded message must decode again
    if (borrowed) {
        auto reencoded = encodeMessage(borrowed.value()).dump();
        auto again = decodeMessage(reencoded);
        if (!again || !(again.value() == borrowed.value())) {
            std::abort();
        }
    }

    return 0;
}
