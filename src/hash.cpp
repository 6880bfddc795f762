#include "blatte/value.hpp"
#include "blatte/hash.hpp"

#include <unordered_set>


static size_t
_hash(const blt::value &x, std::unordered_set<void*> &mem)
{
  std::hash<std::string_view> cstrhash;
  switch (x->t)
  {
    case blt::tag::nil: return 0;
    case blt::tag::sym: return cstrhash(sym_name(x));
    case blt::tag::str: return cstrhash(str_view(x));
    case blt::tag::num: return std::hash<long double> {}(num_val(x));
    case blt::tag::fn: return std::hash<void*> {}(reinterpret_cast<void*>(x->fn.proc));
    case blt::tag::ws:
      return blt::mix_hash(cstrhash(ws_text(x)), _hash(ws_obj(x), mem));
    case blt::tag::pair: {
      // Only pairs on the current path are remembered, so that shared
      // sublists hash like their copies
      if (not mem.emplace(&*x).second)
        return 0;
      const size_t carhash = _hash(car(x), mem);
      const size_t hash = blt::mix_hash(carhash, _hash(cdr<false>(x), mem));
      mem.erase(&*x);
      return hash;
    }
  }
  std::terminate();
}

size_t 
blt::hash(const blt::value &x)
{
  std::unordered_set<void*> mem;
  return _hash(x, mem);
}
