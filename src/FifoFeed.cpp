#include "FifoFeed.h"
#include <loguru/loguru.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using std::string;
using std::vector;

FifoProducer::FifoProducer(const string& path, const vector<string>& chunks,
                           std::chrono::milliseconds delay)
  : _path(path)
{
    _thread = std::thread([this, chunks, delay]() { produce(chunks, delay); });
}

FifoProducer::~FifoProducer()
{
    if (_thread.joinable()) {
        _cancel.store(true);
        _thread.join();
    }
}

void FifoProducer::finish(bool reader_failed)
{
    _cancel.store(true);
    _thread.join();
    if (!_opened.load()) {
        LOG_F(WARNING, "fifo %s was never opened by its reader", _path.c_str());
    }
    if (_errno == 0) return;
    string msg = "fifo producer for " + _path + ": " + _stage + ": " + strerror(_errno);
    if (reader_failed) {
        LOG_F(WARNING, "%s", msg.c_str());
        return;
    }
    throw HarnessException(msg);
}

/**
 * Open the write end once a reader has the FIFO open. Without a reader a
 * non-blocking open fails with ENXIO; retry until one shows up or the run is
 * cancelled, then switch the descriptor back to blocking writes.
 */
int FifoProducer::open_when_read()
{
    while (true) {
        int fd = open(_path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd >= 0) {
            int flags = fcntl(fd, F_GETFL);
            if (flags == -1 || fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) == -1) {
                _errno = errno;
                _stage = "fcntl";
                close(fd);
                return -1;
            }
            return fd;
        }
        if (errno != ENXIO && errno != EINTR) {
            _errno = errno;
            _stage = "open";
            return -1;
        }
        if (_cancel.load()) return -1;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void FifoProducer::produce(const vector<string>& chunks, std::chrono::milliseconds delay)
{
    int fd = open_when_read();
    if (fd == -1) return;
    _opened.store(true);

    for (size_t i = 0; i < chunks.size() && _errno == 0; ++i) {
        if (i > 0) std::this_thread::sleep_for(delay);
        const string& chunk = chunks[i];
        size_t offset = 0;
        while (offset < chunk.size()) {
            ssize_t n = write(fd, chunk.data() + offset, chunk.size() - offset);
            if (n < 0) {
                if (errno == EINTR) continue;
                _errno = errno;
                _stage = "write";
                break;
            }
            offset += static_cast<size_t>(n);
        }
    }
    close(fd);
}


namespace {

/* run 'reader' while a producer feeds the FIFO; always joins the producer */
template <typename Result, typename Reader>
Result with_producer(const string& fifo_path, const vector<string>& chunks,
                     std::chrono::milliseconds delay, Reader reader)
{
    FifoProducer producer(fifo_path, chunks, delay);
    Result result;
    try {
        result = reader();
    }
    catch (...) {
        producer.finish(true);
        throw;
    }
    producer.finish(false);
    return result;
}

vector<string> with_operand(const vector<string>& options, const string& fifo_path)
{
    vector<string> args = options;
    args.push_back(fifo_path);
    return args;
}

} // namespace


/**
 * Create the named pipe used by a FIFO case. Must happen before either the
 * producer or the reader is started.
 *
 * @throws HarnessException if the path exists and is not a FIFO, or mkfifo fails.
 */
void FifoFeed::make_fifo(const string& path)
{
    struct stat st;
    if (lstat(path.c_str(), &st) == 0) {
        if (S_ISFIFO(st.st_mode)) return;
        throw HarnessException("mkfifo " + path + ": exists and is not a fifo");
    }
    if (mkfifo(path.c_str(), 0644) != 0) {
        throw HarnessException("mkfifo " + path + ": " + strerror(errno));
    }
    LOG_F(INFO, "created fifo %s", path.c_str());
}

/**
 * Run 'executable' with 'options' plus the FIFO as operand, while the
 * payload is written into the FIFO from another thread.
 *
 * @param chunks Payload pieces, written in order.
 * @param delay Pause between consecutive chunks (unused for a single chunk).
 */
CmdOutput FifoFeed::run_with_fifo_input(const ProcessRunner& runner,
                                        const string& executable,
                                        const string& fifo_path,
                                        const vector<string>& options,
                                        const vector<string>& chunks,
                                        std::chrono::milliseconds delay,
                                        const std::optional<string>& identity)
{
    const vector<string> args = with_operand(options, fifo_path);
    return with_producer<CmdOutput>(fifo_path, chunks, delay, [&]() {
        return runner.run(executable, args, std::nullopt, identity);
    });
}

std::optional<int> FifoFeed::run_with_fifo_input_to_file(const ProcessRunner& runner,
                                                         const string& executable,
                                                         const string& fifo_path,
                                                         const vector<string>& options,
                                                         const vector<string>& chunks,
                                                         std::chrono::milliseconds delay,
                                                         const std::optional<string>& identity,
                                                         const string& output_path)
{
    const vector<string> args = with_operand(options, fifo_path);
    return with_producer<std::optional<int>>(fifo_path, chunks, delay, [&]() {
        return runner.run_to_file(executable, args, std::nullopt, identity, output_path);
    });
}
