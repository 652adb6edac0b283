/*
 * Copyright (C) 2016 Emeric Poupon
 *
 * This file is part of hlsforge.
 *
 * hlsforge is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * hlsforge is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with hlsforge.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Config.hpp"

#include "core/Exception.hpp"

namespace hlsforge::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw HlsForgeException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw HlsForgeException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw HlsForgeException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        try
        {
            return static_cast<const char*>(_config.lookup(std::string{ setting }));
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        try
        {
            const char* res{ _config.lookup(std::string{ setting }) };
            return std::filesystem::path{ std::string(res) };
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        try
        {
            return static_cast<unsigned int>(_config.lookup(std::string{ setting }));
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        try
        {
            return _config.lookup(std::string{ setting });
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    void Config::visitULongs(std::string_view setting, std::function<void(unsigned long)> _func, std::initializer_list<unsigned long> defs)
    {
        const libconfig::Setting* values{};
        try
        {
            values = &_config.lookup(std::string{ setting });
        }
        catch (const libconfig::SettingNotFoundException&)
        {
            for (unsigned long def : defs)
                _func(def);
            return;
        }

        // both lists "(240, 480)" and arrays "[240, 480]" are accepted
        if (!values->isAggregate())
            throw HlsForgeException{ "Config setting '" + std::string{ setting } + "' must be a list of integers" };

        for (int i{}; i < values->getLength(); ++i)
        {
            const libconfig::Setting& value{ (*values)[i] };
            if (value.getType() != libconfig::Setting::TypeInt && value.getType() != libconfig::Setting::TypeInt64)
                throw HlsForgeException{ "Config setting '" + std::string{ setting } + "' must only contain integers" };

            const long long v{ value };
            if (v < 0)
                throw HlsForgeException{ "Config setting '" + std::string{ setting } + "' must only contain positive integers" };
            _func(static_cast<unsigned long>(v));
        }
    }
} // namespace hlsforge::core
