#pragma once

#include <stdexcept>
#include <string>

// Stage of an analysis pass that produced an error
enum class QueryStage { LOAD, COMPILE, EVALUATE, AGGREGATE, EXPORT, CONFIG };

inline const char* to_string(QueryStage stage) {
    switch (stage) {
        case QueryStage::LOAD:
            return "load";
        case QueryStage::COMPILE:
            return "compile";
        case QueryStage::EVALUATE:
            return "evaluate";
        case QueryStage::AGGREGATE:
            return "aggregate";
        case QueryStage::EXPORT:
            return "export";
        case QueryStage::CONFIG:
            return "config";
    }
    return "unknown";
}

/**
 * @brief Error surfaced to the caller of an analysis stage.
 *
 * The message is prefixed with the stage name, e.g.
 * "[load] cannot open trace file: /tmp/missing.jsonl".
 */
class QueryError : public std::runtime_error {
   private:
    QueryStage stage_;

   public:
    QueryError(QueryStage stage, const std::string& message)
        : std::runtime_error(std::string("[") + to_string(stage) + "] " +
                             message),
          stage_(stage) {}

    QueryStage stage() const { return stage_; }
};
