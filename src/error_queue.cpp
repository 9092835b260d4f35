#include "error_queue.hpp"
#include <cstdio>

void ErrorQueue::push(int16_t code, const std::string& message) {
    if (count_ == CAPACITY) {
        Entry& last = entries_[(head_ + CAPACITY - 1) % CAPACITY];
        last.code = SCPI_ERR::QUEUE_OVERFLOW;
        last.message = "Queue overflow";
        return;
    }

    Entry& slot = entries_[(head_ + count_) % CAPACITY];
    slot.code = code;
    slot.message = message;
    count_++;
}

std::string ErrorQueue::pop() {
    if (count_ == 0) {
        return "0,\"No error\"";
    }

    const Entry& entry = entries_[head_];
    char buf[16];
    snprintf(buf, sizeof(buf), "%d,\"", entry.code);
    std::string out = buf + entry.message + "\"";

    head_ = (head_ + 1) % CAPACITY;
    count_--;
    return out;
}

void ErrorQueue::clear() {
    head_ = 0;
    count_ = 0;
}
