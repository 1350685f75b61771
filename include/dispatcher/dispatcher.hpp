#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

// Main header that includes everything

#include <dispatcher/config.hpp>
#include <dispatcher/errors.hpp>
#include <dispatcher/logging.hpp>
#include <dispatcher/router.hpp>
#include <dispatcher/session.hpp>
#include <dispatcher/types.hpp>
#include <dispatcher/version.hpp>
#include <dispatcher/workdir.hpp>

#endif // DISPATCHER_HPP
