#include "archive/tar_codec.hpp"

#include "archive/tar_writer.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/gzip_reader.hpp"
#include "io/gzip_writer.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <memory>

namespace updsrv {

namespace {

Result WriteTarGz(const std::string& source_dir, FileWriter& file, const CancelToken& cancel) {
    std::unique_ptr<GzipWriter> gz;
    try {
        gz = std::make_unique<GzipWriter>(file);
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Io, std::string("Gzip init failed: ") + e.what());
    }

    TarWriter tar(*gz, cancel);
    auto r = tar.AddDirectory(source_dir);
    if (!r.is_ok()) return r;
    r = tar.Finish();
    if (!r.is_ok()) return r;
    r = gz->Finish();
    if (!r.is_ok()) return r;
    r = file.FsyncNow();
    if (!r.is_ok()) return r;

    LogDebug("tar.gz: %llu entries from %s", (unsigned long long)tar.EntriesWritten(), source_dir.c_str());
    return file.Close();
}

} // namespace

Result TarCodec::CreateTarGz(const std::string& source_dir, const std::string& output_path) const {
    LogDebug("Creating tar.gz archive: %s", output_path.c_str());

    FileWriter file;
    auto r = FileWriter::Open(output_path, file);
    if (!r.is_ok()) return r;

    r = WriteTarGz(source_dir, file, cancel_);
    if (!r.is_ok()) {
        (void)file.Close();
        std::error_code ec;
        std::filesystem::remove(output_path, ec);
    }
    return r;
}

Result TarCodec::ExtractTarGz(const std::string& archive_path,
                              const std::string& dest_dir,
                              TarStreamExtractor::Stats* stats) const {
    LogDebug("Extracting %s to %s", archive_path.c_str(), dest_dir.c_str());

    auto file = std::make_unique<FileReader>();
    auto r = FileReader::Open(archive_path, *file);
    if (!r.is_ok()) return r;

    std::unique_ptr<GzipReader> gz;
    try {
        gz = std::make_unique<GzipReader>(std::move(file));
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Io, std::string("Gzip init failed: ") + e.what());
    }

    TarStreamExtractor extractor(cancel_);
    r = extractor.ExtractToDir(*gz, dest_dir, std::filesystem::path(archive_path).filename().string(), stats);
    if (!r.is_ok() && !gz->LastError().empty()) {
        return Result::Fail(ErrorKind::CorruptAsset,
                            "cannot extract " + archive_path + ": " + gz->LastError() + " after " +
                                std::to_string(gz->CompressedBytes()) + " bytes");
    }
    return r;
}

} // namespace updsrv
