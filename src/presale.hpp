/*
    GSP for the Launchpad token presale
    Copyright (C) 2021  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef LPD_PRESALE_HPP
#define LPD_PRESALE_HPP

#include "authorisation.hpp"
#include "context.hpp"
#include "errors.hpp"

#include "database/database.hpp"

#include <string>

namespace lpd
{

/**
 * Controls the lifecycle of the presale:  It is initialised once (active),
 * and later ended exactly once by an authorised caller.  Ending the presale
 * also launches the token and opens the liquidity-lock window.
 */
class PresaleController
{

private:

  Database& db;
  AuthorisationPolicy& auth;
  const Context& ctx;

public:

  explicit PresaleController (Database& d, AuthorisationPolicy& a,
                              const Context& c)
    : db(d), auth(a), ctx(c)
  {}

  PresaleController () = delete;
  PresaleController (const PresaleController&) = delete;
  void operator= (const PresaleController&) = delete;

  /**
   * Initialises the presale with the given admin.  Fails if it has been
   * initialised before.
   */
  OpStatus Initialise (const std::string& admin);

  /**
   * Ends the presale at the current time.
   */
  OpStatus End (const std::string& caller);

};

} // namespace lpd

#endif // LPD_PRESALE_HPP
