#ifndef SRC_IDLRPC_ID_GENERATOR_HPP_
#define SRC_IDLRPC_ID_GENERATOR_HPP_

#include <cstdint>
#include <random>
#include <string>

namespace idlrpc {

// Source of request ids for a Client. Injected so tests can make ids deterministic.
class IdGenerator {
public:
    IdGenerator() = default;
    virtual ~IdGenerator() = default;

    virtual std::string nextId() = 0;
};

// Ids of kIdLength characters drawn from [0-9a-z].
class RandomIdGenerator : public IdGenerator {
public:
    static constexpr size_t kIdLength = 20;

    // Seeds from std::random_device.
    RandomIdGenerator();
    explicit RandomIdGenerator(uint64_t seed);
    virtual ~RandomIdGenerator() = default;

    std::string nextId() override;

private:
    std::mt19937_64 m_engine;
};

// "1", "2", "3", ...
class SequentialIdGenerator : public IdGenerator {
public:
    SequentialIdGenerator(): m_next(1) { }
    virtual ~SequentialIdGenerator() = default;

    std::string nextId() override { return std::to_string(m_next++); }

private:
    uint64_t m_next;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_ID_GENERATOR_HPP_
