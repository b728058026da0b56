#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered append-only text writer for run journals.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace benchguard {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Writes go to an in-memory buffer and reach the file in `kChunk` blocks.
 *  * Not thread-safe; RunJournal owns each instance from its worker thread.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunk = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** Opens for append. @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      bool isOpen() const noexcept { return fp_ != nullptr; }

      /** Queues one line (caller includes trailing '\n'). @returns false on a failed flush. */
      bool write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      const std::string& path() const noexcept { return path_; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      std::FILE* fp_{ nullptr };
      std::string path_;
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace benchguard
