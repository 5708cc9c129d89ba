#pragma once

#include <libxmute/align.hpp>
#include <libxmute/buffer.hpp>
#include <libxmute/error.hpp>
#include <libxmute/guard.hpp>
#include <libxmute/transmute.hpp>
#include <libxmute/trivial.hpp>
#include <libxmute/util.hpp>
#include <libxmute/validity.hpp>
