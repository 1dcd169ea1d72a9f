#include <scope/scope.h>

namespace scope {

name factory::name_of(raw_name id) { return name(id); }
binder factory::binder_of(raw_name id) { return binder(name_of(id)); }

bool t::member(raw_name id) const {
  for (const node *p = head.get(); p && id <= p->top; p = p->parent.get())
    if (p->id == id)return true;
  return false;
}

t t::extend(const binder &b) const {
  const raw_name top = head && head->top > b.id() ? head->top : b.id();
  return t(std::make_shared<const node>(node{.id = b.id(), .top = top, .parent = head}));
}

raw_scope t::ids() const {
  raw_scope s;
  for (const node *p = head.get(); p; p = p->parent.get())s.insert(p->id);
  return s;
}

bool t::extends(const t &o) const {
  for (const node *p = o.head.get(); p; p = p->parent.get())
    if (!member(p->id))return false;
  return true;
}

t empty() { return t(); }
bool member(const name &n, const t &s) { return s.member(n); }
t extend(const binder &b, const t &s) { return s.extend(b); }
raw_name fresh_name(const t &s) { return s.fresh(); }

std::optional<name> unsink_name(const binder &b, const name &n) {
  if (b.name_of() == n)return std::nullopt;
  return n;
}

renaming::renaming(const binder &from, const binder &to) {
  if (from != to)m.try_emplace(from.id(), to.id());
}

name renaming::operator()(const name &n) const {
  if (auto it = m.find(n.id()); it != m.end())return factory::name_of(it->second);
  return n;
}

binder renaming::operator()(const binder &b) const {
  if (auto it = m.find(b.id()); it != m.end())return factory::binder_of(it->second);
  return b;
}

renaming renaming::without(const binder &b) const {
  renaming r = *this;
  r.m.erase(b.id());
  return r;
}

renaming renaming::merge(const renaming &o) const {
  renaming r = *this;
  for (const auto &[from, to] : o.m) {
    if (!r.m.try_emplace(from, to).second && r.m.at(from) != to) {
      THROW_INVARIANT_VIOLATION("merged renamings disagree on " + std::to_string(from))
    }
  }
  return r;
}

}
