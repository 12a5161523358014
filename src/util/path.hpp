#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"

extern "C" {
#include <sys/stat.h>
}

class TPath {
private:
    std::string Path;
    friend class TFile;

    TPath AddComponent(const TPath &component) const;

public:
    TPath(const std::string &path) : Path(path) {}
    TPath(const char *path) : Path(path) {}
    TPath() : Path("") {}

    bool IsAbsolute() const { return Path[0] == '/'; }

    bool IsRoot() const { return Path == "/"; }

    bool IsEmpty() const { return Path.empty(); }

    explicit operator bool() const { return !Path.empty(); }


    const char *c_str() const noexcept { return Path.c_str(); }

    friend bool operator==(const TPath& a, const TPath& b) {
        return a.ToString() == b.ToString();
    }

    friend bool operator!=(const TPath& a, const TPath& b) {
        return a.ToString() != b.ToString();
    }

    friend std::ostream& operator<<(std::ostream& os, const TPath& path) {
        return os << path.ToString();
    }

    friend TPath operator/(const TPath& a, const TPath &b) {
        return a.AddComponent(b);
    }

    TPath NormalPath() const;

    TPath DirNameNormal() const;
    TPath DirName() const;

    TError StatFollow(struct stat &st) const;

    bool IsRegularFollow() const;
    bool IsDirectoryFollow() const;

    std::string ToString() const;
    bool Exists() const;

    TError Mkfile(unsigned int mode) const;
    TError Mkdir(unsigned int mode) const;
    TError MkdirAll(unsigned int mode) const;
    TError MkdirTmp(const TPath &parent, const std::string &prefix, unsigned int mode);
    TError Rmdir() const;
    TError Unlink() const;

    TError WriteAll(const std::string &text) const;
};

namespace fmt {
template <> struct formatter<TPath> : ostream_formatter {};
}

class TFile {
private:
    TFile(const TFile&) = delete;
    TFile& operator=(const TFile&) = delete;

public:
    union {
        const int Fd;
        int SetFd;
    };
    TFile() : Fd(-1) { }
    TFile(int fd) : Fd(fd) { }
    ~TFile() { Close(); }
    explicit operator bool() const { return Fd >= 0; }
    TError Open(const TPath &path, int flags);
    TError OpenRead(const TPath &path);
    TError OpenWrite(const TPath &path);
    TError OpenDir(const TPath &path);
    TError Create(const TPath &path, int flags, int mode);
    void Close(void);
    TError WriteAll(const std::string &text) const;
    TError Chroot() const;
};
