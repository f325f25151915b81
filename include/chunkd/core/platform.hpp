#pragma once

#ifdef _WIN32
    #define CHUNKD_PLATFORM_WINDOWS
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
#else
    #define CHUNKD_PLATFORM_LINUX
    #include <sys/socket.h>
    #include <sys/time.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
#endif

namespace chunkd {

inline const char* platform_name() {
#ifdef CHUNKD_PLATFORM_WINDOWS
    return "Windows";
#else
    return "Linux";
#endif
}

} // namespace chunkd
