/*
 * Copyright 2024 k8s-agents-injector Authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "instrumentation/EnvListEditor.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class EnvListEditorUnittest : public ::testing::Test {
public:
    void TestGetIndexOfEnv();
    void TestInsertEnvIfAbsent();
    void TestMoveEnvToListEnd();

protected:
    void SetUp() override {
        mEnvs = {MakeEnvVar("A", "1"), MakeEnvVar("OTEL_RESOURCE_ATTRIBUTES", "k=v"), MakeEnvVar("B", "2")};
    }

private:
    vector<EnvVar> mEnvs;
};

void EnvListEditorUnittest::TestGetIndexOfEnv() {
    K8SAGENT_TEST_EQUAL(optional<size_t>(0), GetIndexOfEnv(mEnvs, "A"));
    K8SAGENT_TEST_EQUAL(optional<size_t>(2), GetIndexOfEnv(mEnvs, "B"));
    K8SAGENT_TEST_FALSE(GetIndexOfEnv(mEnvs, "C").has_value());
    K8SAGENT_TEST_FALSE(GetIndexOfEnv({}, "A").has_value());

    // Duplicated names are legal in a pod spec, the first one is reported.
    mEnvs.push_back(MakeEnvVar("A", "3"));
    K8SAGENT_TEST_EQUAL(optional<size_t>(0), GetIndexOfEnv(mEnvs, "A"));
}

void EnvListEditorUnittest::TestInsertEnvIfAbsent() {
    K8SAGENT_TEST_FALSE(InsertEnvIfAbsent(mEnvs, MakeEnvVar("A", "changed")));
    K8SAGENT_TEST_EQUAL(3U, mEnvs.size());
    K8SAGENT_TEST_EQUAL("1", mEnvs[0].value);

    K8SAGENT_TEST_TRUE(InsertEnvIfAbsent(mEnvs, MakeFieldRefEnvVar("C", "metadata.name")));
    K8SAGENT_TEST_EQUAL_FATAL(4U, mEnvs.size());
    K8SAGENT_TEST_TRUE(mEnvs[3] == MakeFieldRefEnvVar("C", "metadata.name"));

    K8SAGENT_TEST_FALSE(InsertEnvIfAbsent(mEnvs, MakeEnvVar("C", "literal")));
    K8SAGENT_TEST_EQUAL(4U, mEnvs.size());
}

void EnvListEditorUnittest::TestMoveEnvToListEnd() {
    MoveEnvToListEnd(mEnvs, GetIndexOfEnv(mEnvs, "OTEL_RESOURCE_ATTRIBUTES"));
    K8SAGENT_TEST_EQUAL_FATAL(3U, mEnvs.size());
    K8SAGENT_TEST_EQUAL("A", mEnvs[0].name);
    K8SAGENT_TEST_EQUAL("B", mEnvs[1].name);
    K8SAGENT_TEST_EQUAL("OTEL_RESOURCE_ATTRIBUTES", mEnvs[2].name);
    K8SAGENT_TEST_EQUAL("k=v", mEnvs[2].value);

    // Already last, absent or out of range: nothing moves.
    vector<EnvVar> expected = mEnvs;
    MoveEnvToListEnd(mEnvs, 2);
    K8SAGENT_TEST_TRUE(expected == mEnvs);
    MoveEnvToListEnd(mEnvs, nullopt);
    K8SAGENT_TEST_TRUE(expected == mEnvs);
    MoveEnvToListEnd(mEnvs, 3);
    K8SAGENT_TEST_TRUE(expected == mEnvs);
}

UNIT_TEST_CASE(EnvListEditorUnittest, TestGetIndexOfEnv)
UNIT_TEST_CASE(EnvListEditorUnittest, TestInsertEnvIfAbsent)
UNIT_TEST_CASE(EnvListEditorUnittest, TestMoveEnvToListEnd)

} // namespace k8sagent

UNIT_TEST_MAIN
