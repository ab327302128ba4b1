/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <algorithm>
#include <fstream>

#include <muniverse/env_spec.h>
#include <muniverse/internal/error_codes.h>
#include <muniverse/internal/logger.h>

namespace muniverse
{
    bool env_spec::allows_key_code(const std::string& code) const
    {
        return std::find(key_whitelist.begin(), key_whitelist.end(), code) != key_whitelist.end();
    }

    int spec_from_json(const nlohmann::json& j, env_spec& spec, std::string& error_message)
    {
        if (!j.is_object())
        {
            error_message = "spec must be a json object";
            return error::INVALID_DATA();
        }
        try
        {
            env_spec ret;
            ret.name = j.at("Name").get<std::string>();
            ret.variant_of = j.value("VariantOf", std::string());
            ret.width = j.at("Width").get<int>();
            ret.height = j.at("Height").get<int>();
            // the adapter options stay an opaque string; objects are re-serialised as is
            if (j.contains("Options"))
            {
                const auto& options = j.at("Options");
                ret.options = options.is_string() ? options.get<std::string>() : options.dump();
            }
            ret.all_canvas = j.value("AllCanvas", false);
            if (j.contains("KeyWhitelist") && !j.at("KeyWhitelist").is_null())
                ret.key_whitelist = j.at("KeyWhitelist").get<std::vector<std::string>>();

            if (ret.name.empty())
            {
                error_message = "spec has an empty name";
                return error::INVALID_DATA();
            }
            if (ret.width <= 0 || ret.height <= 0)
            {
                error_message = "spec " + ret.name + " has a non-positive size";
                return error::INVALID_DATA();
            }
            spec = std::move(ret);
            return error::OK();
        }
        catch (const nlohmann::json::exception& e)
        {
            error_message = e.what();
            return error::INVALID_DATA();
        }
    }

    nlohmann::json spec_to_json(const env_spec& spec)
    {
        nlohmann::json j;
        j["Name"] = spec.name;
        if (!spec.variant_of.empty())
            j["VariantOf"] = spec.variant_of;
        j["Width"] = spec.width;
        j["Height"] = spec.height;
        j["Options"] = spec.options;
        j["AllCanvas"] = spec.all_canvas;
        j["KeyWhitelist"] = spec.key_whitelist;
        return j;
    }

    spec_catalog::spec_catalog(std::vector<env_spec> specs)
        : specs_(std::move(specs))
    {
    }

    int spec_catalog::load(const nlohmann::json& j, std::string& error_message)
    {
        if (!j.is_array())
        {
            error_message = "spec catalog must be a json array";
            return error::INVALID_DATA();
        }
        std::vector<env_spec> specs;
        specs.reserve(j.size());
        for (const auto& item : j)
        {
            env_spec spec;
            int err = spec_from_json(item, spec, error_message);
            if (err != error::OK())
                return err;
            specs.push_back(std::move(spec));
        }
        specs_ = std::move(specs);
        return error::OK();
    }

    int spec_catalog::load_file(const std::filesystem::path& path, std::string& error_message)
    {
        std::ifstream in(path);
        if (!in)
        {
            error_message = "unable to open spec catalog " + path.string();
            return error::NOT_FOUND();
        }
        auto j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded())
        {
            error_message = "spec catalog " + path.string() + " is not valid json";
            return error::INVALID_DATA();
        }
        int err = load(j, error_message);
        if (err == error::OK())
        {
            MUNIVERSE_DEBUG("loaded {} specs from {}", specs_.size(), path.string());
        }
        return err;
    }

    int spec_catalog::find(const std::string& name, env_spec& spec) const
    {
        for (const auto& candidate : specs_)
        {
            if (candidate.name == name)
            {
                spec = candidate;
                return error::OK();
            }
        }
        return error::NOT_FOUND();
    }
}
