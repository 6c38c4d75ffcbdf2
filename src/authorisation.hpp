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

#ifndef LPD_AUTHORISATION_HPP
#define LPD_AUTHORISATION_HPP

#include "params.hpp"

#include "database/database.hpp"

#include <memory>
#include <set>
#include <string>

namespace lpd
{

/**
 * Decides which callers may perform privileged (admin) operations.
 */
class AuthorisationPolicy
{

protected:

  AuthorisationPolicy () = default;

public:

  virtual ~AuthorisationPolicy () = default;

  AuthorisationPolicy (const AuthorisationPolicy&) = delete;
  void operator= (const AuthorisationPolicy&) = delete;

  /**
   * Returns true if the given caller is allowed to perform admin
   * operations.
   */
  virtual bool IsAuthorised (const std::string& caller) = 0;

};

/**
 * Policy that accepts exactly the admin stored in the presale state.
 * Nobody is authorised before the presale has been initialised.
 */
class StoredAdminPolicy : public AuthorisationPolicy
{

private:

  Database& db;

public:

  explicit StoredAdminPolicy (Database& d)
    : db(d)
  {}

  bool IsAuthorised (const std::string& caller) override;

};

/**
 * Policy that accepts any member of a fixed set of principals.
 */
class PrincipalSetPolicy : public AuthorisationPolicy
{

private:

  const std::set<std::string> principals;

public:

  explicit PrincipalSetPolicy (const std::set<std::string>& p)
    : principals(p)
  {}

  bool IsAuthorised (const std::string& caller) override;

};

/**
 * Constructs the policy that should be used according to the parameters:
 * The principal-set policy if admin principals are configured, and the
 * stored-admin policy otherwise.
 */
std::unique_ptr<AuthorisationPolicy> MakeAuthorisationPolicy (
    Database& db, const Params& params);

} // namespace lpd

#endif // LPD_AUTHORISATION_HPP
