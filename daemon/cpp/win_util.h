// daemon/cpp/win_util.h
#ifndef HUSH_WIN_UTIL_H
#define HUSH_WIN_UTIL_H

#include <string>

std::string wide_to_utf8(const std::wstring& wide);

// Joins the calling thread to the multithreaded COM apartment for its
// lifetime. A thread already in another apartment is left as it is.
class ComScope {
public:
    ComScope();
    ~ComScope();

    ComScope(const ComScope&) = delete;
    ComScope& operator=(const ComScope&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_ = false;
    bool should_uninit_ = false;
};

#endif //HUSH_WIN_UTIL_H
