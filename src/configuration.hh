/*
 * Copyright (C) 2024  T+A elektroakustik GmbH & Co. KG
 *
 * This file is part of Rosesong.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA  02110-1301, USA.
 */

#ifndef CONFIGURATION_HH
#define CONFIGURATION_HH

#include <string>
#include <glib.h>

#include "messages.h"

namespace Configuration
{

/*!
 * Read-only configuration stored in an INI file.
 *
 * \tparam ValuesT
 *     Structure holding the values. It must provide the name of the INI
 *     section in \c CONFIGURATION_SECTION_NAME, and a list of key
 *     descriptions in \c all_keys. Each key description must have a
 *     \c name_ and a \c write() function for parsing a string into the
 *     values structure.
 */
template <typename ValuesT>
class ConfigManager
{
  private:
    const std::string configuration_file_;
    const ValuesT &default_settings_;

    ValuesT values_;

  public:
    ConfigManager(const ConfigManager &) = delete;
    ConfigManager &operator=(const ConfigManager &) = delete;

    explicit ConfigManager(std::string &&configuration_file,
                           const ValuesT &defaults):
        configuration_file_(std::move(configuration_file)),
        default_settings_(defaults),
        values_(defaults)
    {}

    /*!
     * Read configuration file.
     *
     * Keys missing from the file and keys with invalid values are set to
     * their defaults.
     *
     * \returns
     *     True if the file has been read, false if it could not be read (in
     *     which case all values are set to defaults).
     */
    bool load()
    {
        ValuesT loaded(default_settings_);

        if(!try_load(configuration_file_.c_str(), loaded))
        {
            reset_to_defaults();
            return false;
        }

        values_ = loaded;

        return true;
    }

    void reset_to_defaults() { values_ = default_settings_; }

    const ValuesT &values() const { return values_; }
    const std::string &get_file_name() const { return configuration_file_; }

  private:
    static bool try_load(const char *file, ValuesT &values)
    {
        GKeyFile *key_file = g_key_file_new();
        GError *error = nullptr;

        if(!g_key_file_load_from_file(key_file, file, G_KEY_FILE_NONE, &error))
        {
            if(g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT))
                msg_vinfo(MESSAGE_LEVEL_DIAG,
                          "Configuration file \"%s\" not found, using defaults",
                          file);
            else
                msg_error(0, LOG_ERR, "Failed reading configuration file \"%s\": %s",
                          file, error->message);

            g_error_free(error);
            g_key_file_free(key_file);

            return false;
        }

        for(const auto &k : ValuesT::all_keys)
        {
            gchar *value =
                g_key_file_get_value(key_file,
                                     ValuesT::CONFIGURATION_SECTION_NAME,
                                     k.name_.c_str(), nullptr);

            if(value == nullptr)
                continue;

            g_strstrip(value);

            if(!k.write(values, value))
                msg_error(0, LOG_WARNING,
                          "Invalid value \"%s\" for key \"%s\" in \"%s\", "
                          "using default",
                          value, k.name_.c_str(), file);

            g_free(value);
        }

        g_key_file_free(key_file);

        return true;
    }
};

}

#endif /* !CONFIGURATION_HH */
