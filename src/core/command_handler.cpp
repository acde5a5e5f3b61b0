#include "fastpack/core/command_handler.hpp"
#include "fastpack/core/config.hpp"
#include "fastpack/core/logger.hpp"
#include "fastpack/core/utils.hpp"
#include "fastpack/storage/filesystem_object_store.hpp"
#include "fastpack/storage/sqlite_metadata_store.hpp"
#include "fastpack/storage/storage_config.hpp"
#include "fastpack/transfer/upload_manager.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace fastpack::core {

namespace {
    constexpr std::chrono::hours REPACKAGING_WAIT{6};

    struct Engine {
        storage::StorageConfig config;
        std::shared_ptr<storage::FilesystemObjectStore> objects;
        std::shared_ptr<storage::SqliteMetadataStore> metadata;
        std::unique_ptr<transfer::UploadManager> manager;
    };

    std::string open_engine(Engine& engine) {
        engine.config = storage::StorageConfig::from_config(Config::instance());
        auto invalid = engine.config.validation_error();
        if (!invalid.empty()) {
            return "Invalid configuration: " + invalid;
        }
        if (!engine.config.create_directories()) {
            return "Cannot create storage directories under " + engine.config.storage_root.string();
        }

        engine.objects = std::make_shared<storage::FilesystemObjectStore>(engine.config.storage_root);
        if (!engine.objects->initialize()) {
            return "Cannot open object store at " + engine.config.storage_root.string();
        }

        engine.metadata = std::make_shared<storage::SqliteMetadataStore>(engine.config.metadata_path);
        if (!engine.metadata->initialize()) {
            return "Cannot open metadata database " + engine.config.metadata_path.string();
        }

        engine.manager = std::make_unique<transfer::UploadManager>(engine.objects, engine.metadata, engine.config);
        return "";
    }

    std::string describe(const Result& result) {
        return std::string(error_code_name(result.error)) + ": " + result.message;
    }

    void print_report(const transfer::StatusReport& report) {
        std::cout << "  Status:   " << storage::upload_status_name(report.status) << "\n";
        std::cout << "  Phase:    " << report.phase << "\n";
        std::cout << "  Progress: " << std::fixed << std::setprecision(1) << report.percent << "%\n";
        if (report.total_chunks > 0) {
            std::cout << "  Chunks:   " << report.uploaded_chunks << "/" << report.total_chunks << "\n";
        }
        if (!report.current_file.empty()) {
            std::cout << "  File:     " << report.current_file << "\n";
        }
        if (!report.artifact_id.empty()) {
            std::cout << "  Artifact: " << report.artifact_id << "\n";
        }
        if (!report.failure_reason.empty()) {
            std::cout << "  Reason:   " << report.failure_reason << "\n";
        }
    }

    Result upload_file_chunks(Engine& engine, const transfer::ChunkPlan& plan, const transfer::FilePlan& file,
                              const std::filesystem::path& path) {
        std::ifstream input(path, std::ios::binary);
        if (!input) {
            return Result(ErrorCode::NOT_FOUND, "Cannot open " + path.string());
        }

        std::vector<uint8_t> buffer;
        for (const auto& chunk : file.chunks) {
            buffer.resize(chunk.length);
            input.seekg(static_cast<std::streamoff>(chunk.offset));
            input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk.length));
            if (static_cast<uint64_t>(input.gcount()) != chunk.length) {
                return Result(ErrorCode::VALIDATION_ERROR, path.string() + " changed while uploading");
            }

            std::string content_tag;
            auto error = engine.manager->retry_executor().execute("upload chunk " + std::to_string(chunk.index), [&] {
                return engine.objects->upload_part(file.multipart, chunk.part_number, buffer, content_tag);
            });
            if (!error.ok()) {
                return transfer::to_result(error, "Chunk " + std::to_string(chunk.index) + " of " + file.name);
            }

            transfer::ChunkConfirmation confirmation{plan.upload_id, file.name, chunk.index, chunk.part_number, content_tag};
            transfer::ChunkProgress progress;
            auto result = engine.manager->confirm_chunk(confirmation, progress);
            if (!result) {
                return result;
            }

            std::cout << "\r  Uploaded " << progress.uploaded << "/" << progress.total << " chunks ("
                      << std::fixed << std::setprecision(1) << progress.percent << "%)" << std::flush;
        }
        return Result::ok();
    }
}

// PackCommandHandler Implementation
CommandResult PackCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::vector<std::filesystem::path> paths;
    transfer::UploadRequest request;
    for (size_t i = 1; i < args.size(); ++i) {
        std::filesystem::path path = utils::FileUtils::expand_home(args[i]);
        if (!utils::FileUtils::is_file(path)) {
            return CommandResult::error("File does not exist: " + path.string());
        }
        auto size = utils::FileUtils::file_size(path);
        if (!size) {
            return CommandResult::error("Cannot stat " + path.string());
        }
        request.files.push_back(transfer::FileDeclaration{path.filename().string(), *size});
        paths.push_back(path);
    }

    try {
        Engine engine;
        auto failure = open_engine(engine);
        if (!failure.empty()) {
            return CommandResult::error(failure);
        }

        transfer::ChunkPlan plan;
        auto result = engine.manager->begin_logical_upload(request, plan);
        if (!result) {
            return CommandResult::error("Cannot start upload: " + describe(result));
        }

        std::cout << "Upload " << plan.upload_id << ": " << plan.files.size() << " file(s), "
                  << plan.total_chunks << " chunk(s)\n";

        for (size_t i = 0; i < plan.files.size(); ++i) {
            result = upload_file_chunks(engine, plan, plan.files[i], paths[i]);
            if (!result) {
                std::cout << "\n";
                auto cancelled = engine.manager->abort_upload(plan.upload_id);
                if (!cancelled) {
                    LOG_WARN("Could not cancel upload {}: {}", plan.upload_id, cancelled.message);
                }
                return CommandResult::error("Upload failed: " + describe(result));
            }
        }
        std::cout << "\n";

        transfer::FinalizeOutcome outcome;
        result = engine.manager->finalize_upload(plan.upload_id, outcome);
        if (!result) {
            return CommandResult::error("Finalize failed: " + describe(result));
        }

        if (outcome.status == storage::UploadStatus::REPACKAGING) {
            std::cout << "Repackaging...\n";
            if (!engine.manager->wait_idle(REPACKAGING_WAIT)) {
                return CommandResult::error("Timed out waiting for repackaging of " + plan.upload_id);
            }
        }

        transfer::StatusReport report;
        result = engine.manager->query_status(plan.upload_id, report);
        if (!result) {
            return CommandResult::error("Cannot read status: " + describe(result));
        }
        if (report.status != storage::UploadStatus::COMPLETED) {
            print_report(report);
            return CommandResult::error("Upload " + plan.upload_id + " did not complete");
        }

        storage::Artifact artifact;
        result = engine.manager->resolve_artifact(report.artifact_id, artifact);
        if (!result) {
            return CommandResult::error("Cannot resolve artifact: " + describe(result));
        }

        std::cout << "Artifact ready\n";
        std::cout << "  Id:      " << artifact.id << "\n";
        std::cout << "  Name:    " << artifact.name << "\n";
        std::cout << "  Size:    " << utils::StringUtils::format_bytes(artifact.size) << "\n";
        std::cout << "  Expires: " << utils::TimeUtils::to_iso_string(artifact.expires_at) << "\n";

        return CommandResult::ok(artifact.id);

    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// StatusCommandHandler Implementation
CommandResult StatusCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    try {
        Engine engine;
        auto failure = open_engine(engine);
        if (!failure.empty()) {
            return CommandResult::error(failure);
        }

        transfer::StatusReport report;
        auto result = engine.manager->query_status(args[1], report);
        if (!result) {
            return CommandResult::error(describe(result));
        }

        std::cout << "Upload " << args[1] << "\n";
        print_report(report);
        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// FetchCommandHandler Implementation
CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const std::string& artifact_id = args[1];
    std::filesystem::path output = utils::FileUtils::expand_home(args[2]);

    try {
        Engine engine;
        auto failure = open_engine(engine);
        if (!failure.empty()) {
            return CommandResult::error(failure);
        }

        storage::Artifact artifact;
        auto result = engine.manager->resolve_artifact(artifact_id, artifact);
        if (!result) {
            return CommandResult::error(describe(result));
        }

        auto key = storage::object_keys::artifact_object(artifact.id);
        auto& retry = engine.manager->retry_executor();

        uint64_t size = 0;
        auto error = retry.execute("head " + key, [&] { return engine.objects->head(key, size); });
        if (!error.ok()) {
            return CommandResult::error("Artifact object missing: " + error.describe());
        }

        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        if (!out) {
            return CommandResult::error("Cannot write " + output.string());
        }

        std::vector<uint8_t> window;
        uint64_t offset = 0;
        while (offset < size) {
            uint64_t length = std::min<uint64_t>(engine.config.read_window, size - offset);
            error = retry.execute("read " + key, [&] {
                return engine.objects->read_range(key, offset, length, window);
            });
            if (!error.ok()) {
                return CommandResult::error("Read failed: " + error.describe());
            }
            if (window.size() != length) {
                return CommandResult::error("Short read from artifact " + artifact.id);
            }
            out.write(reinterpret_cast<const char*>(window.data()), static_cast<std::streamsize>(window.size()));
            if (!out) {
                return CommandResult::error("Write to " + output.string() + " failed");
            }
            offset += length;
        }

        LOG_INFO("Fetched artifact {} to {}", artifact.id, output.string());
        std::cout << "Wrote " << artifact.name << " (" << utils::StringUtils::format_bytes(size) << ") to "
                  << output.string() << "\n";
        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

} // namespace fastpack::core
