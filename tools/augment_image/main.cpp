////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2014-2024, Lawrence Livermore National Security, LLC.
// Produced at the Lawrence Livermore National Laboratory.
// Written by the LBANN Research Team (B. Van Essen, et al.) listed in
// the CONTRIBUTORS file. <lbann-dev@llnl.gov>
//
// LLNL-CODE-697807.
// All rights reserved.
//
// This file is part of Augur: policy-driven image augmentation for
// LBANN. For details, see http://software.llnl.gov/LBANN or
// https://github.com/LLNL/LBANN.
//
// Licensed under the Apache License, Version 2.0 (the "Licensee"); you
// may not use this file except in compliance with the License.  You may
// obtain a copy of the License at:
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
// implied. See the License for the specific language governing
// permissions and limitations under the license.
////////////////////////////////////////////////////////////////////////////////

#include "augur/proto/factories.hpp"
#include "augur/transforms/vision/autoaugment.hpp"
#include "augur/utils/exception.hpp"
#include "augur/utils/logging.hpp"
#include "augur/utils/opencv.hpp"
#include "augur/utils/protobuf.hpp"
#include "augur/utils/random_number_generators.hpp"

#include "augur/proto/policy.pb.h"

#include <opencv2/imgcodecs.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

/** Copy an 8-bit OpenCV image into a type-erased matrix. */
augur::utils::type_erased_matrix to_matrix(const cv::Mat& image,
                                           std::vector<size_t>& dims) {
  dims = {static_cast<size_t>(image.channels()),
          static_cast<size_t>(image.rows),
          static_cast<size_t>(image.cols)};
  El::Matrix<uint8_t> real_mat(augur::utils::get_linearized_size(dims), 1);
  cv::Mat header = augur::utils::get_opencv_mat(real_mat, dims);
  image.copyTo(header);
  return augur::utils::type_erased_matrix(std::move(real_mat));
}

void print_trace(const augur::transform::trace& steps) {
  for (const auto& entry : steps) {
    std::cout << "  " << augur::augment::get_name(entry.step);
    if (!entry.sample.fire) {
      std::cout << " skipped" << std::endl;
      continue;
    }
    if (!entry.sample.name.empty()) {
      std::cout << " " << entry.sample.name << "=" << entry.sample.value;
    }
    std::cout << " changed " << entry.diag.changed_values << " values"
              << std::endl;
  }
}

} // namespace

int main(int argc, char** argv)
{
  if ((argc < 3) || (argc > 6)) {
    std::cout << "Usage: > " << argv[0]
              << " input_image output_prefix [num [seed [policy.prototext]]]"
              << std::endl;
    std::cout << "         num: number of augmented images to write (default 1)"
              << std::endl;
    std::cout << "        seed: random seed (default 42)" << std::endl;
    std::cout << "      policy: AutoAugmentPolicy prototext"
              << " (default: canonical policy)" << std::endl;
    return EXIT_FAILURE;
  }

  augur::logging::setup_loggers();

  const std::string input_name(argv[1]);
  const std::string output_prefix(argv[2]);
  const int num = (argc > 3) ? atoi(argv[3]) : 1;
  const int seed = (argc > 4) ? atoi(argv[4]) : 42;

  try {
    std::unique_ptr<augur::transform::autoaugment> augmenter;
    if (argc > 5) {
      augur_data::AutoAugmentPolicy policy;
      augur::protobuf::text::load(argv[5], policy);
      AUGUR_RT_DEBUG("Loaded policy from {}:\n{}", argv[5],
                     augur::protobuf::text::write(policy));
      augmenter = augur::proto::construct_autoaugment(policy);
    } else {
      augmenter = std::make_unique<augur::transform::autoaugment>();
    }
    AUGUR_RT_DEBUG("{}", augmenter->get_description().str());

    const cv::Mat image = cv::imread(input_name, cv::IMREAD_COLOR);
    if (image.empty()) {
      AUGUR_ERROR("Unable to read image \"", input_name, "\".");
    }
    AUGUR_IO_INFO("Read {} ({}x{})", input_name, image.cols, image.rows);

    augur::init_io_random(seed);
    augur::locked_io_rng_ref io_rng = augur::set_io_generators_local_index(0);

    for (int i = 0; i < num; ++i) {
      std::vector<size_t> dims;
      auto data = to_matrix(image, dims);
      const auto steps = augmenter->apply_with_trace(data, dims);

      const std::string output_name =
        output_prefix + "_" + std::to_string(i) + ".png";
      cv::Mat result = augur::utils::get_opencv_mat(data, dims);
      if (!cv::imwrite(output_name, result)) {
        AUGUR_ERROR("Unable to write image \"", output_name, "\".");
      }
      std::cout << output_name << std::endl;
      print_trace(steps);
    }
  }
  catch (augur::exception const& e) {
    e.print_report(std::cerr);
    return EXIT_FAILURE;
  }
  catch (std::exception const& e) {
    AUGUR_RT_ERR("{}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
