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

#include "authorisation.hpp"

#include "database/presale.hpp"

#include <glog/logging.h>

namespace lpd
{

bool
StoredAdminPolicy::IsAuthorised (const std::string& caller)
{
  PresaleTable tbl(db);
  auto presale = tbl.Get ();
  if (presale == nullptr)
    {
      VLOG (1) << "Presale has no admin yet, rejecting " << caller;
      return false;
    }

  return presale->GetAdmin () == caller;
}

bool
PrincipalSetPolicy::IsAuthorised (const std::string& caller)
{
  return principals.count (caller) > 0;
}

std::unique_ptr<AuthorisationPolicy>
MakeAuthorisationPolicy (Database& db, const Params& params)
{
  if (params.AdminPrincipals ().empty ())
    return std::make_unique<StoredAdminPolicy> (db);

  VLOG (1)
      << "Using principal-set authorisation with "
      << params.AdminPrincipals ().size () << " principals";
  return std::make_unique<PrincipalSetPolicy> (params.AdminPrincipals ());
}

} // namespace lpd
