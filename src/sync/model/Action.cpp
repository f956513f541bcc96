#include "sync/model/Action.hpp"

using namespace ds::sync::model;
using namespace ds::fs::model;

Action ds::sync::model::removal(const Item& item) {
    return {item.meta.isDirectory() ? ActionType::RemoveDir : ActionType::Unlink, item.path, item.meta};
}

Action ds::sync::model::materialize(const Item& item) {
    return {item.meta.isDirectory() ? ActionType::MakeDirs : ActionType::Copy, item.path, item.meta};
}

std::string ds::sync::model::to_string(const ActionType type) {
    switch (type) {
    case ActionType::Unlink: return "unlink";
    case ActionType::RemoveDir: return "rmdir";
    case ActionType::MakeDirs: return "mkdir";
    case ActionType::Copy: return "copy";
    }
    return "unknown";
}
