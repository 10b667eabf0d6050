/***
 * Name: pyjudge::screen::DenyList::defaults
 * Purpose: Built-in deny-lists.
 */
#include "screen/DenyList.h"

namespace pyjudge::screen {

DenyList DenyList::defaults() {
  DenyList list;
  list.modules = {
      "os", "sys", "subprocess", "socket", "shutil", "ctypes", "multiprocessing",
      "asyncio.subprocess", "urllib", "requests", "glob", "pathlib", "__future__",
      "importlib", "io", "builtins", "signal", "pty", "resource",
  };
  list.tokens = {"eval", "exec", "__import__", "open("};
  return list;
}

} // namespace pyjudge::screen
