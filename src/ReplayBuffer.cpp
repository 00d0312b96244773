#include "animus/ReplayBuffer.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace animus {

ReplayBuffer::ReplayBuffer(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity == 0) {
        throw std::invalid_argument("ReplayBuffer: capacité nulle");
    }
    data_.reserve(std::min<std::size_t>(capacity, 4096));
}

void ReplayBuffer::push(Transition t) {
    if (!full_) {
        data_.push_back(std::move(t));
        next_ = data_.size() % capacity_;
        full_ = data_.size() == capacity_;
        return;
    }
    data_[next_] = std::move(t);
    next_ = (next_ + 1) % capacity_;
}

std::vector<Transition> ReplayBuffer::sample(std::size_t batch_size, std::mt19937& rng) const {
    if (batch_size > size()) {
        throw std::invalid_argument("ReplayBuffer::sample: lot plus grand que le buffer");
    }
    std::vector<std::size_t> indices(size());
    std::iota(indices.begin(), indices.end(), 0);

    std::vector<std::size_t> picked;
    picked.reserve(batch_size);
    std::sample(indices.begin(), indices.end(), std::back_inserter(picked), batch_size, rng);

    std::vector<Transition> batch;
    batch.reserve(batch_size);
    for (auto i : picked) batch.push_back(data_[i]);
    return batch;
}

const Transition& ReplayBuffer::at(std::size_t i) const {
    if (i >= size()) throw std::out_of_range("ReplayBuffer::at");
    // Une fois plein, next_ désigne la plus ancienne entrée
    std::size_t base = full_ ? next_ : 0;
    return data_[(base + i) % data_.size()];
}

void ReplayBuffer::clear() {
    data_.clear();
    next_ = 0;
    full_ = false;
}

} // namespace animus
