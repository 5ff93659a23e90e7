#pragma once

namespace imgjoin {

// Owns a POSIX file descriptor and closes it on destruction.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();
    // Returns false if close(2) reported an error.
    bool Close();

private:
    int fd_{-1};
};

} // namespace imgjoin
