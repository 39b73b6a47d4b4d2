#ifndef REACTREE_EXPORT_H
#define REACTREE_EXPORT_H

// REACTREE_SHARED is set by the build when reactree is a shared library, reactree_EXPORTS while building it
#if !defined(REACTREE_SHARED)
#  define REACTREE_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
#  if defined(reactree_EXPORTS)
#    define REACTREE_EXPORT __declspec(dllexport)
#  else
#    define REACTREE_EXPORT __declspec(dllimport)
#  endif
#  if defined(_MSC_VER)
#    pragma warning(disable : 4251 4275)
#  endif
#elif defined(__GNUC__)
#  define REACTREE_EXPORT __attribute__((visibility("default")))
#else
#  define REACTREE_EXPORT
#endif

#endif  // REACTREE_EXPORT_H
