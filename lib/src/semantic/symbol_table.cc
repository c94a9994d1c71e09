//
// Symbol table lookup
//

#include <gdl/semantic.hh>

namespace gdl::semantic {

namespace {
    template<typename Decl>
    const Decl* find_in(const std::map<std::string, const Decl*>& table, std::string_view name) {
        if (auto it = table.find(std::string(name)); it != table.end()) {
            return it->second;
        }
        return nullptr;
    }
}

const ast::entity_decl* symbol_table::find_entity(std::string_view name) const {
    return find_in(entities, name);
}

const ast::behavior_decl* symbol_table::find_behavior(std::string_view name) const {
    return find_in(behaviors, name);
}

const ast::scene_decl* symbol_table::find_scene(std::string_view name) const {
    return find_in(scenes, name);
}

} // namespace gdl::semantic
