#include "idlrpc/IdGenerator.hpp"

namespace idlrpc {

RandomIdGenerator::RandomIdGenerator(): m_engine(std::random_device()()) { }

RandomIdGenerator::RandomIdGenerator(uint64_t seed): m_engine(seed) { }

std::string RandomIdGenerator::nextId() {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<size_t> distribution(0, sizeof(kAlphabet) - 2);
    std::string id(kIdLength, '0');
    for (size_t i = 0; i < kIdLength; ++i) {
        id[i] = kAlphabet[distribution(m_engine)];
    }
    return id;
}

} // namespace idlrpc
