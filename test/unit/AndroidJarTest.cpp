/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "Attributes.h"
#include "ClassFileReader.h"
#include "RescTest.h"
#include "XmlCompiler.h"
#include "ZipReader.h"
#include "utils/Table.h"

// These run against a real platform jar, pointed to by the android_jar_path
// environment variable.
class AndroidJarTest : public RescTest {
 protected:
  void SetUp() override {
    auto path = resc::get_env("android_jar_path");
    if (!path) {
      GTEST_SKIP() << "android_jar_path is not set";
    }
    m_path = *path;
    m_table.import_apk(m_path);
  }

  std::string m_path;
  arsc::Table m_table;
};

TEST_F(AndroidJarTest, dictionaryMatchesPlatform) {
  zip::ZipReader jar(m_path);
  auto codename = jar::find_static_int_field(jar, "android/R$attr",
                                             "compileSdkVersionCodename");
  ASSERT_TRUE(codename);
  EXPECT_EQ((uint32_t)*codename, 0x01010573);
  EXPECT_EQ(m_table.entry_by_ref(arsc::Ref::attr("compileSdkVersionCodename"))
                .id()
                .value(),
            0x01010573);

  // Every id in the dictionary names the attr of the same name.
  for (const auto& info : bxml::attributes()) {
    if (!info.res_id) {
      continue;
    }
    EXPECT_EQ(m_table.entry_by_ref(arsc::Ref::attr(info.name)).id().value(),
              *info.res_id)
        << info.name;
  }
}

TEST_F(AndroidJarTest, compilesManifest) {
  auto compiled = bxml::compile_manifest(
      R"(<manifest xmlns:android="http://schemas.android.com/apk/res/android"
    package="com.example.app" android:versionCode="1"
    android:compileSdkVersion="31" android:compileSdkVersionCodename="12">
  <application android:label="Example" android:icon="@mipmap/icon"
      android:theme="@android:style/Theme.Material" android:debuggable="true">
    <activity android:name=".Main" android:launchMode="singleTop"
        android:configChanges="orientation|keyboardHidden|screenSize"
        android:screenOrientation="portrait" android:exported="true"/>
  </application>
</manifest>)",
      m_table, std::string("com.example.app"));
  auto xml = compiled.manifest.get_if<arsc::XmlChunk>();
  ASSERT_NE(xml, nullptr);
  auto activity = xml->children[5].get_if<arsc::XmlStartElementChunk>();
  ASSERT_NE(activity, nullptr);
  // configChanges, exported, launchMode, name, screenOrientation
  ASSERT_EQ(activity->attributes.size(), 5);
  EXPECT_EQ(activity->attributes[0].typed_value.data, 0x80 | 0x20 | 0x400);
  EXPECT_EQ(activity->attributes[2].typed_value.data, 1);
  EXPECT_EQ(activity->attributes[4].typed_value.data, 1);
}
