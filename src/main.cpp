/* -----------------------------------------------------------
 *  main.cpp – driver: dataset → windows → MLP → JSON export
 * ----------------------------------------------------------- */
#include <cctype>
#include <exception>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "common.hpp"
#include "csv_table.hpp"
#include "cycle_features.hpp"
#include "trainer.hpp"
#include "exporter.hpp"

static void usage(const char* prog)
{
    std::cout <<
        "usage: " << prog << " [--key=value ...]\n"
        "  --data=PATH        input CSV (FedCycle layout)\n"
        "  --out=DIR          output directory for the JSON artifacts\n"
        "  --seq_len=N        previous cycles per window      (6)\n"
        "  --seed=N           split / init / shuffle seed     (42)\n"
        "  --hidden=A,B,...   hidden layer sizes              (32,16)\n"
        "  --alpha=X          L2 penalty                      (0.01)\n"
        "  --lr=X             Adam step size                  (0.001)\n"
        "  --batch=N          minibatch size                  (200)\n"
        "  --epochs=N         max iterations                  (500)\n"
        "  --patience=N       early-stopping patience         (20)\n"
        "  --val_frac=X       early-stopping hold-out         (0.15)\n"
        "  --tol=X            min. hold-out improvement       (1e-4)\n"
        "  --verbose          per-epoch loss / score lines\n";
}

/* whole-string conversions: trailing junk or a sign on the seed throws */
static int to_int(const std::string& s)
{
    size_t pos = 0;
    int v = std::stoi(s, &pos);
    if (pos != s.size()) throw std::invalid_argument(s);
    return v;
}

static double to_real(const std::string& s)
{
    size_t pos = 0;
    double v = std::stod(s, &pos);
    if (pos != s.size()) throw std::invalid_argument(s);
    return v;
}

static unsigned to_seed(const std::string& s)
{
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
        throw std::invalid_argument(s);
    size_t pos = 0;
    unsigned long v = std::stoul(s, &pos);
    if (pos != s.size() || v > std::numeric_limits<unsigned>::max())
        throw std::out_of_range(s);
    return static_cast<unsigned>(v);
}

static std::vector<int> parse_int_list(const std::string& s)
{
    std::vector<int> out;
    std::stringstream ss(s);
    std::string t;
    while (std::getline(ss, t, ','))
        if (!t.empty()) out.push_back(to_int(t));
    return out;
}

/* returns false on a malformed value */
static bool parse_args(int argc, char* argv[], TrainOpt& hp, bool& help)
{
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        try {
            if      (a == "--help" || a == "-h")        help          = true;
            else if (a == "--verbose")                  g_verbose     = true;
            else if (a.rfind("--data=",0)==0)           hp.data_path  = a.substr(7);
            else if (a.rfind("--out=",0)==0)            hp.out_dir    = a.substr(6);
            else if (a.rfind("--seq_len=",0)==0)        hp.seq_len    = to_int(a.substr(10));
            else if (a.rfind("--seed=",0)==0)           hp.seed       = to_seed(a.substr(7));
            else if (a.rfind("--hidden=",0)==0)         hp.hidden     = parse_int_list(a.substr(9));
            else if (a.rfind("--alpha=",0)==0)          hp.alpha      = to_real(a.substr(8));
            else if (a.rfind("--lr=",0)==0)             hp.lr         = to_real(a.substr(5));
            else if (a.rfind("--batch=",0)==0)          hp.batch      = to_int(a.substr(8));
            else if (a.rfind("--epochs=",0)==0)         hp.epochs     = to_int(a.substr(9));
            else if (a.rfind("--patience=",0)==0)       hp.patience   = to_int(a.substr(11));
            else if (a.rfind("--val_frac=",0)==0)       hp.val_frac   = to_real(a.substr(11));
            else if (a.rfind("--tol=",0)==0)            hp.tol        = to_real(a.substr(6));
            else                                        logW("ignored arg: "+a);
        } catch (const std::exception&) {
            logE("bad value in " + a);
            return false;
        }
    }

    if (hp.seq_len < 1)                      { logE("--seq_len must be >= 1");      return false; }
    if (hp.hidden.empty())                   { logE("--hidden needs >= 1 layer");   return false; }
    for (int h : hp.hidden) if (h < 1)       { logE("--hidden sizes must be >= 1"); return false; }
    if (hp.epochs < 1)                       { logE("--epochs must be >= 1");       return false; }
    if (hp.val_frac < 0 || hp.val_frac >= 1) { logE("--val_frac must be in [0,1)"); return false; }
    return true;
}


int main(int argc, char* argv[])
{
    /* ========== 1. CLI and defaults ========================= */
    TrainOpt hp;
    bool help = false;
    if (!parse_args(argc, argv, hp, help)) return 1;
    if (help) { usage(argv[0]); return 0; }

    const std::string bar(60, '=');
    std::cout << bar << "\nCYCLE LENGTH PREDICTION MODEL TRAINING\n" << bar << '\n';

    if (!file_exists(hp.data_path)) {
        logE("Dataset not found at " + hp.data_path);
        return 1;
    }

    try {
        /* ========== 2. Load ================================= */
        std::cout << "Loading dataset from " << hp.data_path << "...\n";
        Table table = load_csv_table(hp.data_path);
        print_table_summary(table);

        /* ========== 3. Windows ============================== */
        std::cout << "\nPreparing features...\n";
        std::vector<Sample> DS = prepare_dataset(table, hp.seq_len);
        if (DS.empty()) {
            logE("No valid samples could be created from the dataset");
            return 1;
        }
        print_dataset_summary(DS);

        /* ========== 4. Train / evaluate ===================== */
        TrainResult R = train_pipeline(DS, hp);
        report_metrics(R.test);

        /* ========== 5. Export =============================== */
        export_model_artifacts(hp.out_dir, *R.model, R.scaler, R.test,
                               feature_names(hp.seq_len));

        std::cout << '\n' << bar << "\nTRAINING COMPLETE\n"
                  << "Model exported to: " << hp.out_dir << '\n' << bar << '\n';
    } catch (const std::exception& e) {
        logE(e.what());
        return 1;
    }
    return 0;
}
