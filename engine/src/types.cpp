#include "chronicle/types.hpp"
#include <array>
#include <utility>

namespace chronicle {

namespace {

constexpr std::array<std::pair<ActionType, const char*>, 9> kActionTypes {{
    {ActionType::File, "file"},
    {ActionType::Content, "content"},
    {ActionType::Metadata, "metadata"},
    {ActionType::Tree, "tree"},
    {ActionType::Learning, "learning"},
    {ActionType::Navigation, "navigation"},
    {ActionType::Settings, "settings"},
    {ActionType::Bookmark, "bookmark"},
    {ActionType::Api, "api"},
}};

constexpr std::array<std::pair<TargetType, const char*>, 14> kTargetTypes {{
    {TargetType::Strand, "strand"},
    {TargetType::Weave, "weave"},
    {TargetType::Loom, "loom"},
    {TargetType::Fabric, "fabric"},
    {TargetType::Flashcard, "flashcard"},
    {TargetType::FlashcardDeck, "flashcard_deck"},
    {TargetType::Quiz, "quiz"},
    {TargetType::QuizQuestion, "quiz_question"},
    {TargetType::GlossaryTerm, "glossary_term"},
    {TargetType::Bookmark, "bookmark"},
    {TargetType::Draft, "draft"},
    {TargetType::Setting, "setting"},
    {TargetType::SearchQuery, "search_query"},
    {TargetType::ApiToken, "api_token"},
}};

constexpr std::array<std::pair<Source, const char*>, 8> kSources {{
    {Source::User, "user"},
    {Source::Autosave, "autosave"},
    {Source::Sync, "sync"},
    {Source::Import, "import"},
    {Source::Undo, "undo"},
    {Source::Redo, "redo"},
    {Source::System, "system"},
    {Source::Api, "api"},
}};

template <typename E, std::size_t N>
const char* name_of(const std::array<std::pair<E, const char*>, N>& table, E value) {
    for (const auto& kv : table) {
        if (kv.first == value) return kv.second;
    }
    return "unknown";
}

template <typename E, std::size_t N>
std::optional<E> lookup(const std::array<std::pair<E, const char*>, N>& table, std::string_view s) {
    for (const auto& kv : table) {
        if (s == kv.second) return kv.first;
    }
    return std::nullopt;
}

} // namespace

const char* to_string(ActionType t) { return name_of(kActionTypes, t); }
const char* to_string(TargetType t) { return name_of(kTargetTypes, t); }
const char* to_string(Source s) { return name_of(kSources, s); }

std::optional<ActionType> parse_action_type(std::string_view s) { return lookup(kActionTypes, s); }
std::optional<TargetType> parse_target_type(std::string_view s) { return lookup(kTargetTypes, s); }
std::optional<Source> parse_source(std::string_view s) { return lookup(kSources, s); }

} // namespace chronicle
