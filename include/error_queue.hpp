#ifndef ERROR_QUEUE_HPP
#define ERROR_QUEUE_HPP

#include <cstdint>
#include <cstddef>
#include <string>

// SCPI error codes used by the bench
namespace SCPI_ERR {
    constexpr int16_t NO_ERROR = 0;
    constexpr int16_t COMMAND_ERROR = -100;
    constexpr int16_t UNDEFINED_HEADER = -113;
    constexpr int16_t MISSING_PARAMETER = -109;
    constexpr int16_t EXECUTION_ERROR = -200;
    constexpr int16_t SETTINGS_CONFLICT = -221;
    constexpr int16_t DATA_OUT_OF_RANGE = -222;
    constexpr int16_t HARDWARE_ERROR = -240;
    constexpr int16_t HARDWARE_MISSING = -241;
    constexpr int16_t QUEUE_OVERFLOW = -350;
    constexpr int16_t MASS_STORAGE_ERROR = -250;
}

// Fixed-depth FIFO behind SYST:ERR?
class ErrorQueue {
public:
    static constexpr size_t CAPACITY = 16;

    // When full the newest entry is replaced by a queue overflow marker
    void push(int16_t code, const std::string& message);

    // Oldest entry as <code>,"<message>"; 0,"No error" when empty
    std::string pop();

    void clear();
    size_t count() const { return count_; }

private:
    struct Entry {
        int16_t code;
        std::string message;
    };

    Entry entries_[CAPACITY];
    size_t head_ = 0;
    size_t count_ = 0;
};

#endif // ERROR_QUEUE_HPP
