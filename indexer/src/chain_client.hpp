#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct ChainTransaction {
    std::string hash;
    std::string from;
    std::string to;              // empty for contract creation
    std::string value;           // raw native units in base 10
    int64_t block_number = 0;
};

struct ChainBlock {
    int64_t number = 0;
    int64_t timestamp = 0;       // Unix seconds
    std::vector<ChainTransaction> transactions;
};

// Read port over chain access. Implementations throw TransientUpstreamError.
class ChainClient {
public:
    virtual ~ChainClient() = default;

    virtual int64_t get_current_block_height() = 0;
    virtual ChainBlock get_block_with_transactions(int64_t height) = 0;
};
