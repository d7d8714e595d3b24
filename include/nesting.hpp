#pragma once

#include <source_location.hpp>

#include <cstdint>
#include <limits>
#include <vector>

namespace kestrel
{

enum class nesting_kind : std::int_fast8_t
{
  Paren,
  Square,
  Curly,
};

char opener_of(nesting_kind kind);
char closer_of(nesting_kind kind);

// index of a frame inside of a nesting_arena
using nesting_ref = std::uint32_t;
constexpr nesting_ref no_nesting = std::numeric_limits<nesting_ref>::max();

struct nesting_frame
{
  location opened_at;
  nesting_kind kind;
  nesting_ref parent;
};

// Frames are only ever appended, so a nesting_ref stays valid for as long as
// the arena lives. This allows several copies of a lexer to point into the
// same stack, each with its own top. Frames of rolled back attempts are
// kept, the arena is bounded by the number of openers in the input.
class nesting_arena
{
public:
  nesting_ref push(const location& opened_at, nesting_kind kind, nesting_ref parent)
  {
    frames.push_back(nesting_frame { opened_at, kind, parent });
    return static_cast<nesting_ref>(frames.size() - 1);
  }

  const nesting_frame& operator[](nesting_ref ref) const
  { return frames[ref]; }

  std::size_t depth(nesting_ref top) const
  {
    std::size_t d = 0;
    for(; top != no_nesting; top = frames[top].parent)
      ++d;
    return d;
  }

  std::size_t size() const { return frames.size(); }
private:
  std::vector<nesting_frame> frames;
};

}
