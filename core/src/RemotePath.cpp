#include "sftpdesk/RemotePath.hpp"

namespace sftpdesk {
namespace RemotePath {

std::vector<std::string> segments(const std::string& path) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty())
                out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
        out.push_back(cur);
    return out;
}

std::string normalize(const std::string& path) {
    std::vector<std::string> stack;
    for (const auto& seg : segments(path)) {
        if (seg == ".")
            continue;
        if (seg == "..") {
            if (!stack.empty())
                stack.pop_back();
            continue;
        }
        stack.push_back(seg);
    }
    if (stack.empty())
        return "/";
    std::string out;
    for (const auto& seg : stack)
        out += "/" + seg;
    return out;
}

std::string resolve(const std::string& base, const std::string& path) {
    if (path.empty())
        return normalize(base);
    if (path.front() == '/')
        return normalize(path);
    return normalize(base + "/" + path);
}

std::string parent(const std::string& path) {
    const std::string n = normalize(path);
    if (n == "/")
        return "/";
    const auto pos = n.find_last_of('/');
    return pos == 0 ? std::string("/") : n.substr(0, pos);
}

std::string baseName(const std::string& path) {
    const std::string n = normalize(path);
    if (n == "/")
        return {};
    return n.substr(n.find_last_of('/') + 1);
}

std::string join(const std::string& dir, const std::string& name) {
    if (dir.empty())
        return std::string("/") + name;
    if (dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

} // namespace RemotePath
} // namespace sftpdesk
