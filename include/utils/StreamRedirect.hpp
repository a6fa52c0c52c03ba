#pragma once

#include <ostream>
#include <streambuf>

namespace navledger::utils {

/**
 * @brief Перенаправить поток в буфер другого потока
 *
 * Исходный буфер возвращается потоку в деструкторе.
 */
class StreamRedirect {
public:
    StreamRedirect(std::ostream& stream, std::ostream& target)
        : stream_(stream)
        , original_(stream.rdbuf(target.rdbuf())) {}

    ~StreamRedirect() {
        stream_.rdbuf(original_);
    }

    StreamRedirect(const StreamRedirect&) = delete;
    StreamRedirect& operator=(const StreamRedirect&) = delete;

    /// Буфер, в который поток писал до перенаправления
    std::streambuf* original() const { return original_; }

private:
    std::ostream& stream_;
    std::streambuf* original_;
};

} // namespace navledger::utils
