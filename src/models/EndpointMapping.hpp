#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// --- Static description of one public data endpoint ---
struct EndpointMapping {
    std::string name;
    std::string opcao;                                   // Upstream "opcao" query value
    std::string default_source;                          // Static fallback file used without a sub-option
    std::map<std::string, std::string> sub_options;      // sub_option -> static fallback file
    std::set<std::string> key_params;                    // Parameters that take part in cache keys

    bool hasSubOption(const std::string& sub_option) const {
        return sub_options.count(sub_option) > 0;
    }

    // Unknown or absent sub-options resolve to the default file.
    const std::string& sourceFor(const std::optional<std::string>& sub_option) const {
        if (sub_option) {
            auto it = sub_options.find(*sub_option);
            if (it != sub_options.end()) {
                return it->second;
            }
        }
        return default_source;
    }
};

namespace EndpointCatalog {
    static constexpr int MIN_YEAR = 1970;
    static constexpr int MAX_YEAR = 2024;

    inline const std::map<std::string, EndpointMapping>& mappings() {
        static const std::map<std::string, EndpointMapping> catalog = [] {
            const std::set<std::string> params = {"year", "sub_option"};
            std::map<std::string, EndpointMapping> m;
            m["producao"] = EndpointMapping{
                "producao", "opt_02", "Producao.csv",
                {{"VINHO DE MESA", "Producao.csv"},
                 {"VINHO FINO DE MESA (VINIFERA)", "Producao.csv"},
                 {"SUCO DE UVA", "Producao.csv"},
                 {"DERIVADOS", "Producao.csv"}},
                params};
            m["processamento"] = EndpointMapping{
                "processamento", "opt_03", "ProcessaViniferas.csv",
                {{"viniferas", "ProcessaViniferas.csv"},
                 {"americanas", "ProcessaAmericanas.csv"},
                 {"mesa", "ProcessaMesa.csv"},
                 {"semclass", "ProcessaSemclass.csv"}},
                params};
            m["comercializacao"] = EndpointMapping{
                "comercializacao", "opt_04", "Comercio.csv",
                {{"VINHO DE MESA", "Comercio.csv"},
                 {"ESPUMANTES", "Comercio.csv"},
                 {"UVAS FRESCAS", "Comercio.csv"},
                 {"SUCO DE UVA", "Comercio.csv"}},
                params};
            m["importacao"] = EndpointMapping{
                "importacao", "opt_05", "ImpVinhos.csv",
                {{"vinhos", "ImpVinhos.csv"},
                 {"espumantes", "ImpEspumantes.csv"},
                 {"frescas", "ImpFrescas.csv"},
                 {"passas", "ImpPassas.csv"},
                 {"suco", "ImpSuco.csv"}},
                params};
            m["exportacao"] = EndpointMapping{
                "exportacao", "opt_06", "ExpVinho.csv",
                {{"vinho", "ExpVinho.csv"},
                 {"uva", "ExpUva.csv"},
                 {"espumantes", "ExpEspumantes.csv"},
                 {"suco", "ExpSuco.csv"}},
                params};
            return m;
        }();
        return catalog;
    }

    // Returns nullptr for names outside the catalog.
    inline const EndpointMapping* find(const std::string& endpoint) {
        const auto& all = mappings();
        auto it = all.find(endpoint);
        if (it == all.end()) {
            return nullptr;
        }
        return &(it->second);
    }

    inline std::vector<std::string> endpointNames() {
        std::vector<std::string> names;
        for (const auto& [name, mapping] : mappings()) {
            names.push_back(name);
        }
        return names;
    }
}
