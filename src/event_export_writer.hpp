#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/utilities/compression/zlib/streaming_compressor_utility.h>
#include <dftracer/utils/utilities/io/streaming_file_writer_utility.h>

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include "query_error.hpp"
#include "trace_event.hpp"

enum class ExportFormat { JSON, CSV };

class EventExportWriter {
   private:
    // Append escaped JSON string to buffer
    static void append_json_string(std::string& buffer, const std::string& str) {
        buffer += '"';
        for (char c : str) {
            switch (c) {
                case '"':
                    buffer += "\\\"";
                    break;
                case '\\':
                    buffer += "\\\\";
                    break;
                case '\b':
                    buffer += "\\b";
                    break;
                case '\f':
                    buffer += "\\f";
                    break;
                case '\n':
                    buffer += "\\n";
                    break;
                case '\r':
                    buffer += "\\r";
                    break;
                case '\t':
                    buffer += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 32) {
                        char hex[7];
                        std::snprintf(hex, sizeof(hex), "\\u%04x",
                                      static_cast<unsigned char>(c));
                        buffer += hex;
                    } else {
                        // UTF-8 bytes pass through unchanged
                        buffer += c;
                    }
                    break;
            }
        }
        buffer += '"';
    }

    static void append_projection(std::string& buffer, const TraceEvent& event,
                                  const std::vector<std::string>& fields) {
        buffer += '{';
        bool first = true;
        for (const auto& field : fields) {
            JsonValue value = event.field(field);
            // Absent fields are left out, null is kept
            if (!value.exists()) continue;
            if (!first) buffer += ',';
            first = false;
            append_json_string(buffer, field);
            buffer += ':';
            buffer += value.to_json();
        }
        buffer += '}';
    }

   public:
    /**
     * @brief JSON array of events, one per line.
     *
     * With fields, each object holds only those (dotted) paths that are
     * present, keyed by the path text; otherwise full records.
     */
    static std::string to_json(const TraceEvents& events,
                               const std::vector<std::string>& fields = {}) {
        std::string buffer;
        buffer += "[";
        for (std::size_t i = 0; i < events.size(); ++i) {
            buffer += i == 0 ? "\n" : ",\n";
            if (fields.empty()) {
                buffer += events[i].to_json();
            } else {
                append_projection(buffer, events[i], fields);
            }
        }
        buffer += events.empty() ? "]\n" : "\n]\n";
        return buffer;
    }

    /**
     * @brief CSV with a header row.
     *
     * Columns are the given fields, or the first event's top-level fields.
     * Each cell holds the JSON encoding of the value, "" when absent.
     */
    static std::string to_csv(const TraceEvents& events,
                              const std::vector<std::string>& fields = {}) {
        std::vector<std::string> columns = fields;
        if (columns.empty() && !events.empty()) {
            columns = events.front().field_names();
        }

        std::string buffer;
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) buffer += ',';
            buffer += columns[c];
        }
        buffer += '\n';

        for (const auto& event : events) {
            for (std::size_t c = 0; c < columns.size(); ++c) {
                if (c > 0) buffer += ',';
                JsonValue value = event.field(columns[c]);
                buffer += value.exists() ? value.to_json() : "\"\"";
            }
            buffer += '\n';
        }
        return buffer;
    }

    static std::string render(ExportFormat format, const TraceEvents& events,
                              const std::vector<std::string>& fields = {}) {
        return format == ExportFormat::CSV ? to_csv(events, fields)
                                           : to_json(events, fields);
    }

    /**
     * @brief Write rendered content to a file, optionally gzip-compressed.
     * @return Path actually written (".gz" appended when compressing)
     * @throws QueryError (EXPORT) if the file cannot be written
     */
    static std::string write(const std::string& output_path,
                             const std::string& content, bool compress = false,
                             int compression_level = 6) {
        std::string path = output_path;
        if (compress &&
            (path.size() < 3 || path.substr(path.size() - 3) != ".gz")) {
            path += ".gz";
        }

        try {
            if (compress) {
                using namespace dftracer::utils::utilities;

                compression::zlib::ManualStreamingCompressorUtility compressor(
                    compression_level,
                    compression::zlib::CompressionFormat::GZIP);

                io::StreamingFileWriterUtility writer(path);

                io::RawData raw_data;
                raw_data.data.assign(content.begin(), content.end());
                auto compressed_chunks = compressor.process(raw_data);

                for (const auto& chunk : compressed_chunks) {
                    io::RawData raw_chunk{chunk.data};
                    writer.process(raw_chunk);
                }

                auto final_chunks = compressor.finalize();
                for (const auto& chunk : final_chunks) {
                    io::RawData raw_chunk{chunk.data};
                    writer.process(raw_chunk);
                }

                writer.close();
            } else {
                FILE* fp = std::fopen(path.c_str(), "w");
                if (!fp) {
                    DFTRACER_UTILS_LOG_ERROR("Failed to open output file: %s",
                                             path.c_str());
                    throw QueryError(QueryStage::EXPORT,
                                     "cannot open output file: " + path);
                }
                std::size_t written =
                    std::fwrite(content.data(), 1, content.size(), fp);
                bool closed = std::fclose(fp) == 0;
                if (written != content.size() || !closed) {
                    throw QueryError(QueryStage::EXPORT,
                                     "short write to output file: " + path);
                }
            }
        } catch (const QueryError&) {
            throw;
        } catch (const std::exception& e) {
            DFTRACER_UTILS_LOG_ERROR("Failed to write output: %s", e.what());
            throw QueryError(QueryStage::EXPORT,
                             "failed to write " + path + ": " + e.what());
        }

        DFTRACER_UTILS_LOG_INFO("Exported %zu bytes to %s%s", content.size(),
                                path.c_str(), compress ? " (compressed)" : "");
        return path;
    }
};
