#pragma once

/**
 * DARNIO_PUBLIC marks the symbols compiled into the translation unit that
 * defines DARNIO_IMPLEMENTATION. Define it before including any darnio header
 * to override the choice made here.
 *
 * Static and single-executable builds only need default ELF visibility. When
 * darnio is compiled into a Windows DLL, define DARNIO_SHARED in both the DLL
 * and its consumers so the symbols are exported and imported.
 */
#ifndef DARNIO_PUBLIC
#  if defined(DARNIO_SHARED) && (defined(_WIN32) || defined(__CYGWIN__))
#    ifdef DARNIO_IMPLEMENTATION
#      define DARNIO_PUBLIC __declspec(dllexport)
#    else
#      define DARNIO_PUBLIC __declspec(dllimport)
#    endif
#  elif defined(__GNUC__)
#    define DARNIO_PUBLIC __attribute__((visibility("default")))
#  else
#    define DARNIO_PUBLIC
#  endif
#endif
