#include "outflow/transfer-engine.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "outflow/file.hpp"
#include "outflow/log.hpp"
#include "outflow/platform.hpp"
#include "outflow/raw-bytes.hpp"
#include "outflow/source-unreadable-error.hpp"
#include "outflow/transfer-config.hpp"
#include "outflow/transfer-sink.hpp"
#include "outflow/transfer-stats.hpp"

namespace outflow {

namespace {

// State of a single transfer call.
struct TransferSession {
  [[nodiscard]] std::size_t remaining() const noexcept { return total - cursor; }

  [[nodiscard]] TransferOutcome outcome(TransferStatus status) const noexcept { return {mode, status, cursor}; }

  const File& source;
  TransferSink& sink;
  std::size_t total;
  std::size_t cursor;
  std::size_t chunkCap;
  TransferMode mode;
};

void ValidateSource(const File& file, std::string_view what) {
  if (!file) {
    const int err = file.openError() == 0 ? EBADF : file.openError();
    throw SourceUnreadableError(err, std::string("Cannot open transfer source ").append(what));
  }
  if (!file.isRegular()) {
    throw SourceUnreadableError(EINVAL, std::string("Transfer source is not a regular file ").append(what));
  }
}

}  // namespace

std::string_view TransferModeName(TransferMode mode) noexcept {
  switch (mode) {
    case TransferMode::ZeroCopy:
      return "zero-copy";
    case TransferMode::Buffered:
      return "buffered";
    default:
      return "unknown";
  }
}

std::string_view TransferStatusName(TransferStatus status) noexcept {
  switch (status) {
    case TransferStatus::Completed:
      return "completed";
    case TransferStatus::Stalled:
      return "stalled";
    case TransferStatus::Error:
      return "error";
    default:
      return "unknown";
  }
}

TransferEngine::TransferEngine(TransferConfig config, TransferStats& stats) : _config(std::move(config)), _stats(stats) {
  _config.validate();
}

TransferOutcome TransferEngine::transfer(std::string_view path, TransferSink& sink) {
  File file(path);
  ValidateSource(file, path);
  return transfer(file, sink);
}

TransferOutcome TransferEngine::transfer(const File& file, TransferSink& sink) {
  ValidateSource(file, "(file)");

  const bool zeroCopy = _config.zeroCopyEnabled && file.size() >= _config.zeroCopyThreshold;
  TransferSession session{file,
                          sink,
                          file.size(),
                          0,
                          zeroCopy ? _config.chunkSize : _config.bufferSize,
                          zeroCopy ? TransferMode::ZeroCopy : TransferMode::Buffered};

  if (session.mode == TransferMode::ZeroCopy) {
    while (session.remaining() != 0) {
      const auto res = sink.transferFrom(file, session.cursor, std::min(session.remaining(), session.chunkCap));
      if (res.code == TransferSink::ChunkResult::Code::Unsupported) {
        _stats.recordError();
        log::debug("Zero-copy unsupported by sink ({}), buffered fallback from offset {}/{}",
                   SystemErrorMessage(res.errnum), session.cursor, session.total);
        session.mode = TransferMode::Buffered;
        session.chunkCap = _config.bufferSize;
        break;
      }
      if (res.code == TransferSink::ChunkResult::Code::Error) {
        _stats.recordError();
        log::error("Zero-copy transfer failed at offset {}/{}: {}", session.cursor, session.total,
                   SystemErrorMessage(res.errnum));
        return session.outcome(TransferStatus::Error);
      }
      if (res.bytesMoved == 0) {
        _stats.recordError();
        log::warn("Zero-copy transfer stalled at offset {}/{}", session.cursor, session.total);
        return session.outcome(TransferStatus::Stalled);
      }
      session.cursor += res.bytesMoved;
    }
  }

  if (session.mode == TransferMode::Buffered && session.remaining() != 0) {
    RawBytes buf(std::min(session.remaining(), session.chunkCap));
    while (session.remaining() != 0) {
      const std::size_t blockSize = std::min(session.remaining(), buf.capacity());
      const std::size_t nbRead = file.readAt(std::span<std::byte>(buf.data(), blockSize), session.cursor);
      if (nbRead == File::kError) {
        _stats.recordError();
        log::error("Read failed at offset {}/{}: {}", session.cursor, session.total,
                   SystemErrorMessage(LastSystemError()));
        return session.outcome(TransferStatus::Error);
      }
      if (nbRead == 0) {
        // File shrunk since it was opened.
        _stats.recordError();
        log::warn("Buffered transfer stalled at offset {}/{}, unexpected end of file", session.cursor, session.total);
        return session.outcome(TransferStatus::Stalled);
      }
      try {
        sink.write(std::span<const std::byte>(buf.data(), nbRead));
      } catch (const std::system_error& ex) {
        _stats.recordError();
        log::error("Buffered write failed at offset {}/{}: {}", session.cursor, session.total, ex.what());
        return session.outcome(TransferStatus::Error);
      }
      session.cursor += nbRead;
    }
  }

  _stats.recordCompleted(session.cursor);
  log::trace("Transferred {} bytes ({})", session.cursor, TransferModeName(session.mode));
  return session.outcome(TransferStatus::Completed);
}

}  // namespace outflow
