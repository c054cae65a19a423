// Implicit-feedback recommender: trains user/item factors with weighted ALS
// on (user, item, signal) triples and answers top-k queries on them.
//
// Run: ./implicitrec [config_file]

#include <omp.h>
#include <stdio.h>
#include <stdlib.h>
#include <exception>
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "elements.hpp"
#include "errors.hpp"
#include "interactions.hpp"
#include "problem.hpp"
#include "model.hpp"
#include "query.hpp"
#include "evaluator.hpp"
#include "solver/als.hpp"

struct configuration {
  std::string train_file, test_file, model_file;
  int n_users = 0, n_items = 0;
  int factors = 20, n_threads = 1, max_iter = 20;
  double lambda = .1, alpha = 40.;
  unsigned int seed = 0;
  bool evaluate_every_iter = true;
  int topk = 10, query_user = -1, query_item = -1;
};

int readConf(struct configuration& conf, std::string conFile) {

  std::ifstream infile(conFile);
  if (!infile.is_open()) {
    std::cerr << "ERROR : cannot open configuration file " << conFile << std::endl;
    return 0;
  }

  std::string line;
  while(std::getline(infile,line))
  {
    std::istringstream iss(line);
    if (line.empty() || (line[0] == '#') || (line[0] == '[')) {
      continue;
    }

    std::string key, equal, val;
    if (iss >> key >> equal >> val) {
      if (equal != "=") {
        continue;
      }
      try {
        if (key == "train_file") {
          conf.train_file = val;
        }
        if (key == "test_file") {
          conf.test_file = val;
        }
        if (key == "model_file") {
          conf.model_file = val;
        }
        if (key == "n_users") {
          conf.n_users = std::stoi(val);
        }
        if (key == "n_items") {
          conf.n_items = std::stoi(val);
        }
        if (key == "factors") {
          conf.factors = std::stoi(val);
        }
        if (key == "lambda") {
          conf.lambda = std::stod(val);
        }
        if (key == "alpha") {
          conf.alpha = std::stod(val);
        }
        if (key == "max_iter") {
          conf.max_iter = std::stoi(val);
        }
        if (key == "nthreads") {
          conf.n_threads = std::stoi(val);
        }
        if (key == "seed") {
          conf.seed = (unsigned int)std::stoul(val);
        }
        if (key == "evaluate") {
          if (val == "true") conf.evaluate_every_iter = true;
          if (val == "false") conf.evaluate_every_iter = false;
        }
        if (key == "topk") {
          conf.topk = std::stoi(val);
        }
        if (key == "query_user") {
          conf.query_user = std::stoi(val);
        }
        if (key == "query_item") {
          conf.query_item = std::stoi(val);
        }
      } catch (const std::logic_error&) {
        std::cerr << "ERROR : bad value '" << val << "' for " << key << std::endl;
        return 0;
      }
    }
  }

  return 1;
}

void print_ranking(const char *title, const std::vector<scored_item>& ranked) {
  printf("%s\n", title);
  for(size_t j=0; j<ranked.size(); ++j) {
    printf("%zu, %d, %f\n", j+1, ranked[j].item_id, ranked[j].score);
  }
}

int main (int argc, char* argv[]) {
  struct configuration conf;
  std::string config_file = "config/default.cfg";

  if (argc > 2) {
    std::cerr << "Usage : " << std::string(argv[0]) << " [config_file]" << std::endl;
    return -1;
  }

  if (argc == 2) {
    config_file = std::string(argv[1]);
  }

  if (!readConf(conf, config_file)) {
    std::cerr << "Usage : " << std::string(argv[0]) << " [config_file]" << std::endl;
    return -1;
  }

  if (conf.train_file.empty()) {
    std::cerr << "ERROR : provide a training file !\n";
    return 1;
  }

  std::cout << "Loading training set file : " << conf.train_file << std::endl;

  std::vector<interaction> records;
  int n_users = 0, n_items = 0;
  if (!read_interactions(conf.train_file, records, n_users, n_items)) return 1;

  // explicit sizes win; they must still cover every id in the file
  if (conf.n_users > 0) n_users = conf.n_users;
  if (conf.n_items > 0) n_items = conf.n_items;

  try {
    // Problem definition
    Problem prob(conf.lambda, conf.alpha);
    prob.set_data(records, n_users, n_items);
    printf("%d users, %d items, %d interactions\n", prob.get_nusers(), prob.get_nitems(), prob.n_interactions);

    // Model definition
    Model model(conf.factors);

    // Evaluator definition
    EvaluatorBinary eval;
    Evaluator* evalp = NULL;
    if (!conf.test_file.empty()) {
      std::vector<int> k_list;
      k_list.push_back(1);
      k_list.push_back(5);
      k_list.push_back(10);
      k_list.push_back(100);

      std::cout << "Reading test set file : " << conf.test_file << std::endl;
      if (!eval.load_file(prob.train, conf.test_file, k_list)) return 1;
      evalp = &eval;
    }

    // Solver definition
    omp_set_dynamic(0);
    omp_set_num_threads(conf.n_threads);

    printf("ALS with %d threads, %d factors, lambda %g, alpha %g..\n",
           conf.n_threads, conf.factors, conf.lambda, conf.alpha);

    SolverALS mySolver(conf.max_iter, conf.n_threads, conf.seed);
    mySolver.evaluate_every_iter = conf.evaluate_every_iter;

    if (evalp) {
      printf("iteration, training time (sec), objective, precision@K, AUC\n");
    } else {
      printf("iteration, training time (sec), objective\n");
    }

    mySolver.solve(prob, model, evalp);

    if (evalp && !conf.evaluate_every_iter) {
      eval.evaluate(model);
      eval.evaluateAUC(model);
      printf("\n");
    }

    if (!conf.model_file.empty()) {
      if (!model.writeFile(conf.model_file)) {
        std::cerr << "ERROR : cannot write model file " << conf.model_file << std::endl;
        return 1;
      }
      std::cout << "Model written to : " << conf.model_file << std::endl;
    }

    if (conf.query_user >= 0) {
      printf("recommendations for user %d\n", conf.query_user);
      print_ranking("rank, item, score", recommend(model, prob.train, conf.query_user, conf.topk));
    }

    if (conf.query_item >= 0) {
      printf("items similar to item %d\n", conf.query_item);
      print_ranking("rank, item, score", similar_items(model, conf.query_item, conf.topk));
    }

  } catch (const std::exception& e) {
    std::cerr << "ERROR : " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
