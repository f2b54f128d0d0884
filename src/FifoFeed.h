#pragma once

#include "ProcessRunner.h"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * Background writer for one run of a FIFO reader. Construction starts the
 * thread, which waits for a reader to appear on the FIFO and then writes
 * every chunk in order; 'finish' joins it and throws if the producer failed.
 *
 * The producer never blocks in open(): it polls with O_NONBLOCK until a
 * reader exists or 'finish' cancels it, so a reader that exits without ever
 * opening the FIFO cannot strand the thread.
 */
class FifoProducer {
  public:
    FifoProducer(const std::string& path, const std::vector<std::string>& chunks,
                 std::chrono::milliseconds delay);
    ~FifoProducer();

    /**
     * Join the producer after the reader has exited.
     *
     * @param reader_failed The reader run threw; its error takes precedence,
     *                      so a producer failure is only logged.
     * @throws HarnessException if the producer could not write its payload.
     */
    void finish(bool reader_failed);

    /* true once the producer got a write end; for logging and tests */
    bool opened() const { return _opened.load(); }

  private:
    void produce(const std::vector<std::string>& chunks, std::chrono::milliseconds delay);
    int open_when_read(); // -1 when cancelled or on error

    std::string _path;
    std::thread _thread;
    std::atomic<bool> _opened {false};
    std::atomic<bool> _cancel {false};
    int _errno = 0;
    std::string _stage;
};

/**
 * Drives a reader process whose only input is a named pipe. A background
 * producer opens the FIFO for writing and writes the payload chunks in order,
 * pausing between chunks, while the reader runs through a ProcessRunner. The
 * producer is always joined once the reader is done, and any error it hit is
 * rethrown, so a short or failed write can never go unnoticed.
 *
 * The FIFO path is appended to 'options' as the reader's file operand.
 */
class FifoFeed {
  public:
    /* create a FIFO at 'path' (mode 0644) unless one already exists there */
    static void make_fifo(const std::string& path);

    static CmdOutput run_with_fifo_input(const ProcessRunner& runner,
                                         const std::string& executable,
                                         const std::string& fifo_path,
                                         const std::vector<std::string>& options,
                                         const std::vector<std::string>& chunks,
                                         std::chrono::milliseconds delay,
                                         const std::optional<std::string>& identity = std::nullopt);

    static std::optional<int> run_with_fifo_input_to_file(const ProcessRunner& runner,
                                                          const std::string& executable,
                                                          const std::string& fifo_path,
                                                          const std::vector<std::string>& options,
                                                          const std::vector<std::string>& chunks,
                                                          std::chrono::milliseconds delay,
                                                          const std::optional<std::string>& identity,
                                                          const std::string& output_path);
};
