#include "uuid/random_source.hpp"

#include <system_error>

#if defined(UUUIDV7_PLATFORM_UNIX)
#include <cerrno>
#include <sys/random.h>
#include <sys/types.h>
#elif defined(UUUIDV7_PLATFORM_WINDOWS)
#include <windows.h>
#include <bcrypt.h>
#endif

#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace uuuidv7 {
void SystemRandomSource::fillBytes(uint8_t *buffer, size_t size)
{
#if defined(UUUIDV7_PLATFORM_UNIX)
    size_t filled = 0;
    while (filled < size) {
        // getrandom может вернуть меньше запрошенного или прерваться сигналом
        const ssize_t result = getrandom(buffer + filled, size - filled, 0);
        if (result < 0) {
            const int error = errno;
            if (error == EINTR) {
                continue;
            }
            LOG_ERROR << "Ошибка getrandom: " << utils::errnoToString(error);
            throw std::system_error(error, std::generic_category(), "getrandom");
        }
        filled += static_cast<size_t>(result);
    }
#elif defined(UUUIDV7_PLATFORM_WINDOWS)
    const NTSTATUS status = BCryptGenRandom(nullptr, buffer, static_cast<ULONG>(size),
                                            BCRYPT_USE_SYSTEM_PREFERRED_RNG);
    if (!BCRYPT_SUCCESS(status)) {
        LOG_ERROR << "Ошибка BCryptGenRandom, статус: " << status;
        throw std::system_error(static_cast<int>(status), std::system_category(),
                                "BCryptGenRandom");
    }
#else
    UNREACHABLE("Unsupported platform");
#endif
}
} // namespace uuuidv7
