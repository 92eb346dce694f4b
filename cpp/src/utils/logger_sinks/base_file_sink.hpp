#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace comphub::utils
{

/**
 * @class BaseFileSink
 * @brief Owns one append-mode file handle for file-backed logger sinks.
 *
 * Not a Sink itself: FileSink inherits it privately and layers the Sink
 * interface on top.
 */
class BaseFileSink
{
  public:
    BaseFileSink();
    /** @brief Closes the file handle if one is open. */
    virtual ~BaseFileSink();

    BaseFileSink(const BaseFileSink &) = delete;
    BaseFileSink &operator=(const BaseFileSink &) = delete;
    BaseFileSink(BaseFileSink &&) = delete;
    BaseFileSink &operator=(BaseFileSink &&) = delete;

  protected:
    /**
     * @brief Opens `path` for appending, creating it if needed.
     * @param use_flock Serialize writes with an advisory lock (POSIX only).
     * @throws std::system_error on failure to open the file.
     */
    void open(const std::filesystem::path &path, bool use_flock);

    void close();

    /// @throws std::system_error on a short or failed write.
    void fwrite(const std::string &content);

    void fflush();

    bool is_open() const;

    const std::filesystem::path &path() const { return m_path; }

  protected:
    std::filesystem::path m_path;
    bool m_use_flock = false;

#ifdef COMPHUB_PLATFORM_WIN64
    void *m_file_handle = nullptr; // HANDLE, kept opaque to avoid <windows.h>
#else
    int m_fd = -1;
#endif
};

} // namespace comphub::utils
