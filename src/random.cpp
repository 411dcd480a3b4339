// ============================================================================
// random.cpp: implementation for udpx/random.hpp
// ============================================================================

#include "udpx/random.hpp"

#include <fcntl.h>     // ::open
#include <unistd.h>    // ::read, ::close
#include <cerrno>      // EINTR

namespace udpx {

bool random_bytes(uint8_t* out, size_t bytes) {
    if (bytes == 0) return true;

    int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;

    size_t got = 0;
    while (got < bytes) {
        ssize_t n = ::read(fd, out + got, bytes - got);
        if (n < 0) {
            if (errno == EINTR) continue;   // interrupted: try again
            ::close(fd);
            return false;
        }
        if (n == 0) {                       // should never happen on urandom
            ::close(fd);
            return false;
        }
        got += (size_t)n;
    }

    ::close(fd);
    return true;
}

} // namespace udpx
