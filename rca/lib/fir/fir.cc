#include <fir/fir.h>
#include <error/error.h>

namespace rca::fir {

namespace {
template<typename K, typename V>
const V &get_or_throw(const util::index_map<K, V> &arena, std::string_view arena_name, K id) {
  const V *p = arena.get(id);
  if (p == nullptr)throw error::missing_node(arena_name, id);
  return *p;
}
}

const callable_decl *item::as_callable() const {
  if (auto c = std::get_if<item_kind::callable>(&kind))return &c->decl;
  return nullptr;
}

std::string_view item::name() const {
  return std::visit(util::overloaded{
      [](const item_kind::callable &c) -> std::string_view { return c.decl.name; },
      [](const item_kind::namespace_ &n) -> std::string_view { return n.name; },
      [](const item_kind::ty &t) -> std::string_view { return t.name; }
  }, kind);
}

const item &package::get_item(local_item_id id) const { return get_or_throw(items, "item", id); }
const block &package::get_block(block_id id) const { return get_or_throw(blocks, "block", id); }
const stmt &package::get_stmt(stmt_id id) const { return get_or_throw(stmts, "stmt", id); }
const expr &package::get_expr(expr_id id) const { return get_or_throw(exprs, "expr", id); }
const pat &package::get_pat(pat_id id) const { return get_or_throw(pats, "pat", id); }

const callable_decl &package::get_callable(local_item_id id) const {
  const callable_decl *decl = get_item(id).as_callable();
  if (decl == nullptr)throw error::malformed_fir("item " + std::to_string(id) + " is not a callable");
  return *decl;
}

std::optional<local_item_id> package::find_callable(std::string_view name) const {
  for (const auto &[id, it] : items) {
    if (it.as_callable() != nullptr && it.name() == name)return id;
  }
  return std::nullopt;
}

const package &package_store::get(package_id id) const { return get_or_throw(packages, "package", id); }

package_id package_store::insert(package &&p) {
  const package_id id = packages.next_key();
  packages.insert(id, std::move(p));
  return id;
}

}
