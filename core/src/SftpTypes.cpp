#include "sftpdesk/SftpTypes.hpp"

namespace sftpdesk {

std::string permissionString(std::uint32_t mode, bool isDir, bool isLink) {
    std::string s(10, '-');
    if (isLink)
        s[0] = 'l';
    else if (isDir)
        s[0] = 'd';
    static const char kFlags[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & (1u << (8 - i)))
            s[static_cast<std::size_t>(i + 1)] = kFlags[i];
    }
    return s;
}

} // namespace sftpdesk
