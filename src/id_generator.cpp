// filename: src/id_generator.cpp
#include <core/id_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

std::string UuidIdGenerator::next() {
    boost::uuids::uuid u;
    {
        std::lock_guard<std::mutex> lk(mu_);
        u = gen_();
    }
    return boost::uuids::to_string(u);
}

std::string SequentialIdGenerator::next() {
    const uint64_t n = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
    return prefix_ + std::to_string(n);
}

std::shared_ptr<IdGenerator> make_id_generator(IdKind kind) {
    switch (kind) {
        case IdKind::Sequential:
            return std::make_shared<SequentialIdGenerator>();
        default:
            return std::make_shared<UuidIdGenerator>();
    }
}
