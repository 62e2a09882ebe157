// filename: core/id_generator.hpp
#pragma once
#include <boost/uuid/random_generator.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

// Produces message ids at publish time. Implementations must be safe to call
// from several threads at once and must never repeat an id.
class IdGenerator {
public:
    virtual std::string next() = 0;
    virtual ~IdGenerator() = default;
};

// Random (v4) UUIDs in canonical string form.
class UuidIdGenerator : public IdGenerator {
public:
    std::string next() override;

private:
    // boost::uuids::random_generator is not thread-safe
    std::mutex mu_;
    boost::uuids::random_generator gen_;
};

// "m1", "m2", ... deterministic, for tests and debugging.
class SequentialIdGenerator : public IdGenerator {
public:
    explicit SequentialIdGenerator(std::string prefix = "m")
        : prefix_(std::move(prefix)) {}

    std::string next() override;

private:
    std::string prefix_;
    std::atomic<uint64_t> counter_{0};
};

enum class IdKind {Uuid, Sequential};

std::shared_ptr<IdGenerator> make_id_generator(IdKind kind);
